// Errors.cpp — Коды ошибок и классификация исключений

#include "twinpane/Errors.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace TwinPane {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::InvalidRequest: return "InvalidRequest";
        case ErrorCode::MethodNotFound: return "MethodNotFound";
        case ErrorCode::InvalidParams: return "InvalidParams";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::RequestTimeout: return "RequestTimeout";
        case ErrorCode::HostNotFound: return "HostNotFound";
        case ErrorCode::CredentialNotFound: return "CredentialNotFound";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::OperationFailed: return "OperationFailed";
        case ErrorCode::RequestCancelled: return "RequestCancelled";
        default: return "Unknown";
    }
}

ErrorCode errorCodeFromInt(int32_t value) {
    switch (static_cast<ErrorCode>(value)) {
        case ErrorCode::ParseError:
        case ErrorCode::InvalidRequest:
        case ErrorCode::MethodNotFound:
        case ErrorCode::InvalidParams:
        case ErrorCode::InternalError:
        case ErrorCode::RequestTimeout:
        case ErrorCode::HostNotFound:
        case ErrorCode::CredentialNotFound:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::PermissionDenied:
        case ErrorCode::FileNotFound:
        case ErrorCode::OperationFailed:
        case ErrorCode::RequestCancelled:
            return static_cast<ErrorCode>(value);
        default:
            return ErrorCode::InternalError;
    }
}

ErrorCode errorCodeFromErrc(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorCode::FileNotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return ErrorCode::PermissionDenied;
    }
    if (ec == std::errc::connection_refused || ec == std::errc::connection_reset ||
        ec == std::errc::connection_aborted || ec == std::errc::not_connected ||
        ec == std::errc::timed_out || ec == std::errc::host_unreachable) {
        return ErrorCode::ConnectionFailed;
    }
    return ErrorCode::OperationFailed;
}

ErrorCode classifyErrorMessage(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto has = [&lower](const char* needle) {
        return lower.find(needle) != std::string::npos;
    };

    if (has("not found")) {
        if (has("host")) return ErrorCode::HostNotFound;
        if (has("credential")) return ErrorCode::CredentialNotFound;
        if (has("file")) return ErrorCode::FileNotFound;
    }
    if (has("permission") || has("denied") || has("eacces")) {
        return ErrorCode::PermissionDenied;
    }
    if (has("connect")) {
        return ErrorCode::ConnectionFailed;
    }
    return ErrorCode::OperationFailed;
}

FileOperationError makeFileError(const std::string& context, const std::error_code& ec) {
    return FileOperationError(errorCodeFromErrc(ec), context + ": " + ec.message());
}

ErrorCode classifyException(const std::exception& e) {
    if (auto* fileError = dynamic_cast<const FileOperationError*>(&e)) {
        return fileError->code();
    }
    if (auto* fsError = dynamic_cast<const std::filesystem::filesystem_error*>(&e)) {
        return errorCodeFromErrc(fsError->code());
    }
    return classifyErrorMessage(e.what());
}

} // namespace TwinPane

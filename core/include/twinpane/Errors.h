// Errors.h — Коды ошибок и типизированные исключения ядра

#pragma once

#include "export.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// ErrorCode — коды ошибок (JSON-RPC + прикладные)
// ═══════════════════════════════════════════════════════════

enum class ErrorCode : int32_t {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    RequestTimeout = -32000,        // Только на стороне клиента
    HostNotFound = -32001,
    CredentialNotFound = -32002,
    ConnectionFailed = -32003,
    PermissionDenied = -32004,
    FileNotFound = -32005,
    OperationFailed = -32006,

    RequestCancelled = -32099       // Только на стороне клиента
};

TP_API const char* errorCodeName(ErrorCode code);

/// Код из числа на проводе; неизвестные числа → InternalError
TP_API ErrorCode errorCodeFromInt(int32_t value);

// ═══════════════════════════════════════════════════════════
// FileOperationError — ошибка, типизированная в месте возникновения
// ═══════════════════════════════════════════════════════════

class TP_API FileOperationError : public std::runtime_error {
public:
    FileOperationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

/// Код по системной ошибке (ENOENT → FileNotFound, EACCES/EPERM → PermissionDenied)
TP_API ErrorCode errorCodeFromErrc(const std::error_code& ec);

/// Классификация по тексту сообщения (для чужих исключений)
TP_API ErrorCode classifyErrorMessage(const std::string& message);

/// "<context>: <OS message>" с кодом по errc
TP_API FileOperationError makeFileError(const std::string& context, const std::error_code& ec);

/// Код для произвольного исключения:
/// FileOperationError → свой код, filesystem_error → по errc, иначе по тексту
TP_API ErrorCode classifyException(const std::exception& e);

} // namespace TwinPane

// RpcProtocol.cpp — Конверты сообщений и имена методов RPC

#include "twinpane/Rpc/RpcProtocol.h"
#include <openssl/rand.h>
#include <cstdio>

namespace TwinPane {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// RpcMethod names
// ═══════════════════════════════════════════════════════════

namespace {

struct MethodName {
    RpcMethod method;
    const char* name;
};

constexpr MethodName METHOD_NAMES[] = {
    {RpcMethod::TransferAddJob, "transfer.addJob"},
    {RpcMethod::TransferPauseJob, "transfer.pauseJob"},
    {RpcMethod::TransferResumeJob, "transfer.resumeJob"},
    {RpcMethod::TransferCancelJob, "transfer.cancelJob"},
    {RpcMethod::TransferClearCompleted, "transfer.clearCompleted"},
    {RpcMethod::TransferGetAllJobs, "transfer.getAllJobs"},
    {RpcMethod::TransferResolveConflict, "transfer.resolveConflict"},
    {RpcMethod::TransferDrop, "transfer.drop"},
    {RpcMethod::SftpList, "sftp.ls"},
    {RpcMethod::SftpStat, "sftp.stat"},
    {RpcMethod::SftpRemove, "sftp.rm"},
    {RpcMethod::SftpMkdir, "sftp.mkdir"},
    {RpcMethod::SftpRename, "sftp.rename"},
    {RpcMethod::SftpNewFile, "sftp.newFile"},
    {RpcMethod::SftpResolveSymlink, "sftp.resolveSymlink"},
    {RpcMethod::SftpRemoteCopy, "sftp.remoteCopy"},
    {RpcMethod::SftpRemoteMove, "sftp.remoteMove"},
    {RpcMethod::SftpUpload, "sftp.upload"},
    {RpcMethod::SftpDownload, "sftp.download"},
    {RpcMethod::LocalCopy, "local.copy"},
    {RpcMethod::LocalMove, "local.move"},
    {RpcMethod::SearchFiles, "search.files"},
    {RpcMethod::ContextCalculateChecksum, "context.calculateChecksum"},
    {RpcMethod::ContextCreateSymlink, "context.createSymlink"},
    {RpcMethod::PermissionsSave, "permissions.save"},
    {RpcMethod::BulkRename, "bulk.rename"},
};

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

const char* rpcMethodName(RpcMethod method) {
    for (const auto& entry : METHOD_NAMES) {
        if (entry.method == method) return entry.name;
    }
    return "unknown";
}

std::optional<RpcMethod> rpcMethodFromName(const std::string& name) {
    for (const auto& entry : METHOD_NAMES) {
        if (name == entry.name) return entry.method;
    }
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════
// EnvelopeCodec
// ═══════════════════════════════════════════════════════════

std::string EnvelopeCodec::serialize(const RpcRequest& request) {
    json j = {
        {"type", ENVELOPE_REQUEST},
        {"request", {
            {"id", request.id},
            {"method", request.method},
            {"params", request.params}
        }}
    };
    return j.dump();
}

std::string EnvelopeCodec::serialize(const RpcResponse& response) {
    json body = {{"id", response.id}};
    if (response.error) {
        json error = {
            {"code", static_cast<int32_t>(response.error->code)},
            {"message", response.error->message}
        };
        if (!response.error->data.is_null()) {
            error["data"] = response.error->data;
        }
        body["error"] = error;
    } else {
        body["result"] = response.result;
    }

    json j = {
        {"type", ENVELOPE_RESPONSE},
        {"response", body}
    };
    return j.dump();
}

std::string EnvelopeCodec::serialize(const RpcNotification& notification) {
    json j = {
        {"type", ENVELOPE_NOTIFICATION},
        {"notification", {
            {"method", notification.method},
            {"params", notification.params}
        }}
    };
    return j.dump();
}

Envelope EnvelopeCodec::parse(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw RpcProtocolError(ErrorCode::ParseError, "Parse error: malformed JSON");
    }
    if (!j.is_object()) {
        throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid request: envelope is not an object");
    }

    std::string type = stringField(j, "type");
    Envelope envelope;

    if (type == ENVELOPE_REQUEST) {
        auto it = j.find("request");
        if (it == j.end() || !it->is_object()) {
            throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid request: missing request body");
        }
        envelope.type = EnvelopeType::Request;
        envelope.request.id = stringField(*it, "id");
        envelope.request.method = stringField(*it, "method");
        if (envelope.request.id.empty()) {
            throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid request: missing id");
        }
        if (envelope.request.method.empty()) {
            throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid request: missing method",
                                   envelope.request.id);
        }
        envelope.request.params = it->value("params", json::object());
        return envelope;
    }

    if (type == ENVELOPE_RESPONSE) {
        auto it = j.find("response");
        if (it == j.end() || !it->is_object() || stringField(*it, "id").empty()) {
            throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid response: missing id");
        }
        envelope.type = EnvelopeType::Response;
        envelope.response.id = stringField(*it, "id");
        envelope.response.result = it->value("result", json());

        auto err = it->find("error");
        if (err != it->end() && err->is_object()) {
            RpcError error;
            error.code = errorCodeFromInt(err->value("code", static_cast<int32_t>(ErrorCode::InternalError)));
            error.message = stringField(*err, "message");
            error.data = err->value("data", json());
            envelope.response.error = error;
        }
        return envelope;
    }

    if (type == ENVELOPE_NOTIFICATION) {
        auto it = j.find("notification");
        if (it == j.end() || !it->is_object() || stringField(*it, "method").empty()) {
            throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid notification: missing method");
        }
        envelope.type = EnvelopeType::Notification;
        envelope.notification.method = stringField(*it, "method");
        envelope.notification.params = it->value("params", json::object());
        return envelope;
    }

    throw RpcProtocolError(ErrorCode::InvalidRequest, "Invalid request: unknown envelope type '" + type + "'");
}

// ═══════════════════════════════════════════════════════════
// generateRequestId
// ═══════════════════════════════════════════════════════════

std::string generateRequestId() {
    uint8_t bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    // Version 4, variant 10xx
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3],
             bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11],
             bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

} // namespace TwinPane

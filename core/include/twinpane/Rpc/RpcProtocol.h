// RpcProtocol.h — Конверты сообщений и имена методов RPC

#pragma once

#include "../export.h"
#include "../Errors.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr int DEFAULT_RPC_TIMEOUT_MS = 30000;

constexpr const char* ENVELOPE_REQUEST = "rpc-request";
constexpr const char* ENVELOPE_RESPONSE = "rpc-response";
constexpr const char* ENVELOPE_NOTIFICATION = "rpc-notification";

// Уведомления host → UI
constexpr const char* NOTIFY_TRANSFER_UPDATE = "transfer.update";
constexpr const char* NOTIFY_TRANSFER_QUEUE_STATE = "transfer.queueState";
constexpr const char* NOTIFY_TRANSFER_CONFLICT = "transfer.conflict";
constexpr const char* NOTIFY_PERMISSIONS_PROGRESS = "permissions.progress";

// ═══════════════════════════════════════════════════════════
// RpcMethod — перечень методов, исполняемых хостом
// ═══════════════════════════════════════════════════════════

enum class RpcMethod : int32_t {
    // Очередь передач
    TransferAddJob,
    TransferPauseJob,
    TransferResumeJob,
    TransferCancelJob,
    TransferClearCompleted,
    TransferGetAllJobs,
    TransferResolveConflict,
    TransferDrop,

    // Файловые операции
    SftpList,
    SftpStat,
    SftpRemove,
    SftpMkdir,
    SftpRename,
    SftpNewFile,
    SftpResolveSymlink,
    SftpRemoteCopy,
    SftpRemoteMove,
    SftpUpload,
    SftpDownload,
    LocalCopy,
    LocalMove,
    SearchFiles,
    ContextCalculateChecksum,
    ContextCreateSymlink,
    PermissionsSave,
    BulkRename
};

/// Имя на проводе: "transfer.addJob", "sftp.ls", ...
TP_API const char* rpcMethodName(RpcMethod method);
TP_API std::optional<RpcMethod> rpcMethodFromName(const std::string& name);

// ═══════════════════════════════════════════════════════════
// Сообщения
// ═══════════════════════════════════════════════════════════

struct RpcError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    nlohmann::json data;                    // null если нет
};

struct RpcRequest {
    std::string id;
    std::string method;
    nlohmann::json params;
};

struct RpcResponse {
    std::string id;
    nlohmann::json result;
    std::optional<RpcError> error;

    bool ok() const { return !error.has_value(); }
};

struct RpcNotification {
    std::string method;
    nlohmann::json params;
};

enum class EnvelopeType {
    Request,
    Response,
    Notification
};

struct Envelope {
    EnvelopeType type = EnvelopeType::Request;
    RpcRequest request;
    RpcResponse response;
    RpcNotification notification;
};

/// Конверт не удалось разобрать. requestId заполнен, если id удалось извлечь.
class TP_API RpcProtocolError : public std::runtime_error {
public:
    RpcProtocolError(ErrorCode code, const std::string& message, std::string requestId = "")
        : std::runtime_error(message), m_code(code), m_requestId(std::move(requestId)) {}

    ErrorCode code() const { return m_code; }
    const std::string& requestId() const { return m_requestId; }

private:
    ErrorCode m_code;
    std::string m_requestId;
};

// ═══════════════════════════════════════════════════════════
// EnvelopeCodec — (де)сериализация конвертов
// ═══════════════════════════════════════════════════════════

class TP_API EnvelopeCodec {
public:
    static std::string serialize(const RpcRequest& request);
    static std::string serialize(const RpcResponse& response);
    static std::string serialize(const RpcNotification& notification);

    /// @throws RpcProtocolError (ParseError / InvalidRequest)
    static Envelope parse(const std::string& text);
};

// ═══════════════════════════════════════════════════════════
// Utilities
// ═══════════════════════════════════════════════════════════

/// Случайный UUID v4 (OpenSSL RAND_bytes)
TP_API std::string generateRequestId();

} // namespace TwinPane

// EngineHost.cpp — Обработчики RPC поверх очереди и файловых систем

#include "twinpane/EngineHost.h"
#include "twinpane/FileSystem/LocalFileSystem.h"
#include "twinpane/FileSystem/PathUtils.h"
#include "twinpane/Rpc/JsonCodec.h"
#include "twinpane/Errors.h"
#include <spdlog/spdlog.h>

namespace TwinPane {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// Разбор параметров
// ═══════════════════════════════════════════════════════════

namespace {

std::string requireString(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw FileOperationError(ErrorCode::InvalidParams, std::string("Invalid params: missing ") + key);
    }
    return it->get<std::string>();
}

std::vector<std::string> requireStringArray(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_array()) {
        throw FileOperationError(ErrorCode::InvalidParams, std::string("Invalid params: missing ") + key);
    }
    return it->get<std::vector<std::string>>();
}

std::optional<std::string> optionalString(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

FileSystemKind fileSystemKind(const json& params, FileSystemKind fallback) {
    auto value = optionalString(params, "fileSystem");
    if (!value) return fallback;

    auto kind = fileSystemKindFromString(*value);
    if (!kind) {
        throw FileOperationError(ErrorCode::InvalidParams, "Invalid params: unknown file system '" + *value + "'");
    }
    return *kind;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════

class EngineHost::Impl {
public:
    Impl(EventLoop& loop, std::shared_ptr<MessageChannel> channel,
         std::shared_ptr<FileSystemOperations> localFs,
         RemoteFileSystemProvider remoteProvider, EngineConfig config)
        : m_config(std::move(config)),
          m_localFs(std::move(localFs)),
          m_remoteProvider(std::move(remoteProvider)),
          m_router(std::move(channel)),
          m_queue(loop, m_localFs, m_remoteProvider, m_config),
          m_dispatcher(m_localFs, m_remoteProvider, m_queue) {}

    void wireNotifications() {
        m_queue.onJobUpdated([this](const TransferJob& job) {
            m_router.notify(NOTIFY_TRANSFER_UPDATE, {{"job", toJson(job)}});
        });
        m_queue.onQueueChanged([this](const std::vector<TransferJob>& jobs, const TransferQueueSummary& summary) {
            m_router.notify(NOTIFY_TRANSFER_QUEUE_STATE, {{"jobs", toJson(jobs)}, {"summary", toJson(summary)}});
        });
        m_queue.onConflict([this](const TransferConflict& conflict) {
            m_router.notify(NOTIFY_TRANSFER_CONFLICT, {{"conflict", toJson(conflict)}});
        });
    }

    std::shared_ptr<FileSystemOperations> fileSystemFor(const json& params, FileSystemKind fallback) {
        if (fileSystemKind(params, fallback) == FileSystemKind::Local) {
            return m_localFs;
        }
        return requireRemote(m_remoteProvider, requireString(params, "hostId"));
    }

    /// {sourcePaths, targetPath} внутри одной системы
    json runBatch(const json& params, FileSystemKind system, bool isCopy) {
        DropRequest request;
        request.hostId = params.value("hostId", "");
        request.sourcePaths = requireStringArray(params, "sourcePaths");
        request.sourcePane.system = system;
        request.targetPane.system = system;
        request.targetPath = requireString(params, "targetPath");
        request.isCopy = isCopy;

        m_dispatcher.dispatch(request);
        return nullptr;
    }

    json enqueue(const json& params, TransferType type) {
        std::string localPath = requireString(params, "localPath");
        std::string remotePath = requireString(params, "remotePath");
        std::string hostId = requireString(params, "hostId");

        auto ids = type == TransferType::Upload
            ? m_dispatcher.enqueue(type, hostId, localPath, remotePath)
            : m_dispatcher.enqueue(type, hostId, remotePath, localPath);
        return {{"jobId", ids.empty() ? "" : ids.front()}, {"jobIds", ids}};
    }

    void registerTransferMethods() {
        m_router.registerHandler(RpcMethod::TransferAddJob, [this](const json& params) -> json {
            m_queue.addJob(transferJobFromJson(params.at("job")));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::TransferPauseJob, [this](const json& params) -> json {
            m_queue.pauseJob(requireString(params, "jobId"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::TransferResumeJob, [this](const json& params) -> json {
            m_queue.resumeJob(requireString(params, "jobId"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::TransferCancelJob, [this](const json& params) -> json {
            m_queue.cancelJob(requireString(params, "jobId"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::TransferClearCompleted, [this](const json&) -> json {
            m_queue.clearCompleted();
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::TransferGetAllJobs, [this](const json&) -> json {
            return {{"jobs", toJson(m_queue.getAllJobs())}, {"summary", toJson(m_queue.getSummary())}};
        });

        m_router.registerHandler(RpcMethod::TransferResolveConflict, [this](const json& params) -> json {
            std::string transferId = requireString(params, "transferId");
            std::string actionName = requireString(params, "action");
            auto action = conflictActionFromString(actionName);
            if (!action) {
                throw FileOperationError(ErrorCode::InvalidParams,
                                         "Invalid params: unknown conflict action '" + actionName + "'");
            }
            m_queue.resolveConflict(transferId, *action, params.value("applyToAll", false));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::TransferDrop, [this](const json& params) -> json {
            auto result = m_dispatcher.dispatch(dropRequestFromJson(params));
            json steps = json::array();
            for (const auto& step : result.plan.steps) {
                steps.push_back(toJson(step));
            }
            return {
                {"operation", transferOperationToString(result.plan.route.operation)},
                {"steps", steps},
                {"jobIds", result.jobIds}
            };
        });
    }

    void registerFileMethods() {
        m_router.registerHandler(RpcMethod::SftpList, [this](const json& params) -> json {
            FileSystemKind kind = fileSystemKind(params, FileSystemKind::Remote);
            std::string path = params.value("path", "");
            auto files = fileSystemFor(params, FileSystemKind::Remote)->listFiles(path);
            std::string currentPath = kind == FileSystemKind::Local
                ? pathToUtf8(LocalFileSystem::resolvePath(path)) : path;
            return {
                {"files", toJson(files)},
                {"currentPath", toForwardSlashes(currentPath)},
                {"fileSystem", fileSystemKindToString(kind)}
            };
        });

        m_router.registerHandler(RpcMethod::SftpStat, [this](const json& params) -> json {
            return toJson(fileSystemFor(params, FileSystemKind::Remote)->stat(requireString(params, "path")));
        });

        m_router.registerHandler(RpcMethod::SftpRemove, [this](const json& params) -> json {
            fileSystemFor(params, FileSystemKind::Remote)->remove(requireString(params, "path"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::SftpMkdir, [this](const json& params) -> json {
            fileSystemFor(params, FileSystemKind::Remote)->mkdir(requireString(params, "path"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::SftpRename, [this](const json& params) -> json {
            fileSystemFor(params, FileSystemKind::Remote)->rename(
                requireString(params, "oldPath"), requireString(params, "newPath"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::SftpNewFile, [this](const json& params) -> json {
            fileSystemFor(params, FileSystemKind::Remote)->newFile(requireString(params, "path"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::SftpResolveSymlink, [this](const json& params) -> json {
            auto target = fileSystemFor(params, FileSystemKind::Remote)->resolveSymlink(
                requireString(params, "symlinkPath"));
            return {{"targetPath", target}};
        });

        m_router.registerHandler(RpcMethod::SftpRemoteCopy, [this](const json& params) -> json {
            requireString(params, "hostId");
            return runBatch(params, FileSystemKind::Remote, true);
        });

        m_router.registerHandler(RpcMethod::SftpRemoteMove, [this](const json& params) -> json {
            requireString(params, "hostId");
            return runBatch(params, FileSystemKind::Remote, false);
        });

        m_router.registerHandler(RpcMethod::SftpUpload, [this](const json& params) -> json {
            return enqueue(params, TransferType::Upload);
        });

        m_router.registerHandler(RpcMethod::SftpDownload, [this](const json& params) -> json {
            return enqueue(params, TransferType::Download);
        });

        m_router.registerHandler(RpcMethod::LocalCopy, [this](const json& params) -> json {
            return runBatch(params, FileSystemKind::Local, true);
        });

        m_router.registerHandler(RpcMethod::LocalMove, [this](const json& params) -> json {
            return runBatch(params, FileSystemKind::Local, false);
        });
    }

    void registerContextMethods() {
        m_router.registerHandler(RpcMethod::SearchFiles, [this](const json& params) -> json {
            auto results = fileSystemFor(params, FileSystemKind::Local)->searchFiles(
                requireString(params, "path"),
                optionalString(params, "pattern"),
                optionalString(params, "content"),
                params.value("recursive", true));
            return {{"results", toJson(results)}};
        });

        m_router.registerAsyncHandler(RpcMethod::ContextCalculateChecksum,
            [this](const json& params, Responder responder) {
                std::string path = requireString(params, "path");
                std::string algorithmName = params.value("algorithm", "sha256");
                auto algorithm = hashAlgorithmFromString(algorithmName);
                if (!algorithm) {
                    responder.reject(ErrorCode::InvalidParams,
                                     "Invalid params: unknown algorithm '" + algorithmName + "'");
                    return;
                }

                std::string checksum = fileSystemFor(params, FileSystemKind::Local)->calculateChecksum(path, *algorithm);
                responder.resolve({
                    {"checksum", checksum},
                    {"algorithm", hashAlgorithmToString(*algorithm)},
                    {"filename", baseName(path)}
                });
            });

        m_router.registerHandler(RpcMethod::ContextCreateSymlink, [this](const json& params) -> json {
            fileSystemFor(params, FileSystemKind::Local)->createSymlink(
                requireString(params, "sourcePath"), requireString(params, "targetPath"));
            return nullptr;
        });

        m_router.registerHandler(RpcMethod::PermissionsSave, [this](const json& params) -> json {
            std::string path = requireString(params, "path");
            std::string octal = requireString(params, "octal");
            auto fs = fileSystemFor(params, FileSystemKind::Local);

            if (params.value("recursive", false)) {
                fs->chmodRecursive(path, octal, [this](int64_t current, int64_t total, const std::string& p) {
                    m_router.notify(NOTIFY_PERMISSIONS_PROGRESS,
                                    {{"current", current}, {"total", total}, {"path", p}});
                });
            } else {
                fs->chmod(path, octal);
            }
            return nullptr;
        });

        // Пакетная операция: сбойные элементы пропускаются
        m_router.registerHandler(RpcMethod::BulkRename, [this](const json& params) -> json {
            auto fs = fileSystemFor(params, FileSystemKind::Local);
            auto operations = params.at("operations");
            if (!operations.is_array()) {
                throw FileOperationError(ErrorCode::InvalidParams, "Invalid params: operations must be an array");
            }

            int32_t renamed = 0;
            json failed = json::array();
            for (const auto& op : operations) {
                std::string oldPath = requireString(op, "oldPath");
                std::string newPath = requireString(op, "newPath");
                try {
                    fs->rename(oldPath, newPath);
                    ++renamed;
                } catch (const FileOperationError& e) {
                    spdlog::warn("EngineHost: Bulk rename of {} failed: {}", oldPath, e.what());
                    failed.push_back({{"oldPath", oldPath}, {"error", e.what()}});
                }
            }
            return {{"renamed", renamed}, {"failed", failed}};
        });
    }

    EngineConfig m_config;
    std::shared_ptr<FileSystemOperations> m_localFs;
    RemoteFileSystemProvider m_remoteProvider;
    RpcRouter m_router;
    TransferQueue m_queue;
    TransferDispatcher m_dispatcher;
};

// ═══════════════════════════════════════════════════════════
// Public interface
// ═══════════════════════════════════════════════════════════

EngineHost::EngineHost(EventLoop& loop,
                       std::shared_ptr<MessageChannel> channel,
                       std::shared_ptr<FileSystemOperations> localFs,
                       RemoteFileSystemProvider remoteProvider,
                       EngineConfig config)
    : m_impl(std::make_unique<Impl>(loop, std::move(channel), std::move(localFs),
                                    std::move(remoteProvider), std::move(config))) {
    m_impl->wireNotifications();
    m_impl->registerTransferMethods();
    m_impl->registerFileMethods();
    m_impl->registerContextMethods();
    spdlog::info("EngineHost: Ready, {} methods registered", m_impl->m_router.registeredMethods().size());
}

EngineHost::~EngineHost() {
    shutdown();
}

TransferQueue& EngineHost::transferQueue() {
    return m_impl->m_queue;
}

TransferDispatcher& EngineHost::dispatcher() {
    return m_impl->m_dispatcher;
}

RpcRouter& EngineHost::router() {
    return m_impl->m_router;
}

const EngineConfig& EngineHost::config() const {
    return m_impl->m_config;
}

void EngineHost::shutdown() {
    m_impl->m_queue.dispose();
}

} // namespace TwinPane

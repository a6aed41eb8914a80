// EngineHost.h — Связывает RPC с очередью передач и файловыми системами

#pragma once

#include "export.h"
#include "EngineConfig.h"
#include "FileSystem/FileSystemOperations.h"
#include "Rpc/EventLoop.h"
#include "Rpc/MessageChannel.h"
#include "Rpc/RpcRouter.h"
#include "Transfer/TransferDispatcher.h"
#include "Transfer/TransferQueue.h"
#include <memory>

namespace TwinPane {

/// Исполняющая сторона: регистрирует все методы transfer.*, sftp.*, local.*,
/// search.*, context.*, permissions.*, bulk.* и рассылает уведомления очереди.
class TP_API EngineHost {
public:
    EngineHost(EventLoop& loop,
               std::shared_ptr<MessageChannel> channel,
               std::shared_ptr<FileSystemOperations> localFs,
               RemoteFileSystemProvider remoteProvider,
               EngineConfig config = {});
    ~EngineHost();

    EngineHost(const EngineHost&) = delete;
    EngineHost& operator=(const EngineHost&) = delete;

    TransferQueue& transferQueue();
    TransferDispatcher& dispatcher();
    RpcRouter& router();
    const EngineConfig& config() const;

    /// Отменить незавершённые передачи
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace TwinPane

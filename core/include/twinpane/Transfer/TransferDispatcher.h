// TransferDispatcher.h — Исполнение плана переноса

#pragma once

#include "../export.h"
#include "../FileSystem/FileSystemOperations.h"
#include "TransferQueue.h"
#include "TransferRouter.h"
#include <memory>
#include <string>
#include <vector>

namespace TwinPane {

/// Копирование/перемещение внутри одной системы выполняется сразу,
/// передачи между системами ставятся в очередь.
class TP_API TransferDispatcher {
public:
    struct Result {
        TransferPlan plan;
        std::vector<std::string> jobIds;    // Только для upload/download
    };

    TransferDispatcher(std::shared_ptr<FileSystemOperations> localFs,
                       RemoteFileSystemProvider remoteProvider,
                       TransferQueue& queue);

    /// Спланировать и выполнить drag-and-drop
    Result dispatch(const DropRequest& request);

    /// Выполнить план; первая ошибка синхронного шага прерывает план
    /// @throws FileOperationError
    Result execute(const TransferPlan& plan);

    /// Поставить в очередь файл или каталог (каталог раскладывается на задачи по файлам,
    /// каталоги назначения создаются сразу)
    /// @return ID созданных задач
    std::vector<std::string> enqueue(TransferType type, const std::string& hostId,
                                     const std::string& sourcePath,
                                     const std::string& destinationPath);

private:
    std::shared_ptr<FileSystemOperations> m_localFs;
    RemoteFileSystemProvider m_remoteProvider;
    TransferQueue& m_queue;
};

} // namespace TwinPane

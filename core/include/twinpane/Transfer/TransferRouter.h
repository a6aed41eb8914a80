// TransferRouter.h — Матрица маршрутизации: какая операция для какой пары систем

#pragma once

#include "../export.h"
#include "../Models.h"
#include <string>
#include <vector>

namespace TwinPane {

enum class TransferOperation : int32_t {
    LocalCopy = 0,
    LocalMove = 1,
    RemoteCopy = 2,
    RemoteMove = 3,
    Upload = 4,         // local → remote, источник сохраняется
    Download = 5        // remote → local, источник сохраняется
};

TP_API const char* transferOperationToString(TransferOperation operation);

struct TransferRoute {
    TransferOperation operation = TransferOperation::LocalCopy;
    FileSystemKind source = FileSystemKind::Local;
    FileSystemKind destination = FileSystemKind::Local;
    bool removesSource = false;

    /// Upload/Download идут через очередь передач
    bool crossesSystems() const { return source != destination; }
};

/// Один запланированный вызов
struct TransferStep {
    TransferOperation operation = TransferOperation::LocalCopy;
    std::string sourcePath;
    std::string destinationPath;
};

struct TransferPlan {
    TransferRoute route;
    std::string hostId;
    std::vector<TransferStep> steps;
};

/// Чистая логика без состояния
class TP_API TransferRouter {
public:
    /// Операция по паре систем; isCopy учитывается только внутри одной системы
    static TransferRoute route(FileSystemKind source, FileSystemKind destination, bool isCopy);

    /// Система цели берётся из панели, путь не анализируется
    static FileSystemKind targetSystem(const PaneState& targetPane);

    /// Шаг на каждый исходный путь: targetPath + "/" + basename(source).
    /// Элементы, которые уже лежат в целевом каталоге той же системы, пропускаются.
    static TransferPlan planDrop(const DropRequest& request);
};

} // namespace TwinPane

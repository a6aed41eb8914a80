// TransferRouter.cpp — Матрица маршрутизации

#include "twinpane/Transfer/TransferRouter.h"
#include "twinpane/FileSystem/PathUtils.h"
#include <spdlog/spdlog.h>

namespace TwinPane {

const char* transferOperationToString(TransferOperation operation) {
    switch (operation) {
        case TransferOperation::LocalCopy:  return "localCopy";
        case TransferOperation::LocalMove:  return "localMove";
        case TransferOperation::RemoteCopy: return "remoteCopy";
        case TransferOperation::RemoteMove: return "remoteMove";
        case TransferOperation::Upload:     return "upload";
        case TransferOperation::Download:   return "download";
        default:                            return "unknown";
    }
}

TransferRoute TransferRouter::route(FileSystemKind source, FileSystemKind destination, bool isCopy) {
    TransferRoute r;
    r.source = source;
    r.destination = destination;

    if (source == FileSystemKind::Local && destination == FileSystemKind::Local) {
        r.operation = isCopy ? TransferOperation::LocalCopy : TransferOperation::LocalMove;
        r.removesSource = !isCopy;
    } else if (source == FileSystemKind::Remote && destination == FileSystemKind::Remote) {
        r.operation = isCopy ? TransferOperation::RemoteCopy : TransferOperation::RemoteMove;
        r.removesSource = !isCopy;
    } else if (source == FileSystemKind::Local) {
        r.operation = TransferOperation::Upload;
    } else {
        r.operation = TransferOperation::Download;
    }
    return r;
}

FileSystemKind TransferRouter::targetSystem(const PaneState& targetPane) {
    return targetPane.system;
}

TransferPlan TransferRouter::planDrop(const DropRequest& request) {
    TransferPlan plan;
    plan.hostId = request.hostId;
    plan.route = route(request.sourcePane.system, targetSystem(request.targetPane), request.isCopy);

    for (const auto& source : request.sourcePaths) {
        if (source.empty()) continue;

        TransferStep step;
        step.operation = plan.route.operation;
        step.sourcePath = source;
        step.destinationPath = joinPath(request.targetPath, baseName(source));

        if (!plan.route.crossesSystems() &&
            toForwardSlashes(source) == step.destinationPath) {
            spdlog::debug("TransferRouter: {} already in {}, skipped", source, request.targetPath);
            continue;
        }
        plan.steps.push_back(std::move(step));
    }

    spdlog::debug("TransferRouter: Drop of {} items planned as {} ({} steps)",
                  request.sourcePaths.size(), transferOperationToString(plan.route.operation),
                  plan.steps.size());
    return plan;
}

} // namespace TwinPane

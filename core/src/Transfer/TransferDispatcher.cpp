// TransferDispatcher.cpp — Исполнение плана переноса

#include "twinpane/Transfer/TransferDispatcher.h"
#include "twinpane/FileSystem/PathUtils.h"
#include "twinpane/Errors.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace TwinPane {

TransferDispatcher::TransferDispatcher(std::shared_ptr<FileSystemOperations> localFs,
                                       RemoteFileSystemProvider remoteProvider,
                                       TransferQueue& queue)
    : m_localFs(std::move(localFs)), m_remoteProvider(std::move(remoteProvider)), m_queue(queue) {}

TransferDispatcher::Result TransferDispatcher::dispatch(const DropRequest& request) {
    return execute(TransferRouter::planDrop(request));
}

TransferDispatcher::Result TransferDispatcher::execute(const TransferPlan& plan) {
    Result result;
    result.plan = plan;

    for (const auto& step : plan.steps) {
        switch (step.operation) {
            case TransferOperation::LocalCopy:
                m_localFs->copy(step.sourcePath, step.destinationPath);
                break;
            case TransferOperation::LocalMove:
                m_localFs->move(step.sourcePath, step.destinationPath);
                break;
            case TransferOperation::RemoteCopy:
                requireRemote(m_remoteProvider, plan.hostId)->copy(step.sourcePath, step.destinationPath);
                break;
            case TransferOperation::RemoteMove:
                requireRemote(m_remoteProvider, plan.hostId)->move(step.sourcePath, step.destinationPath);
                break;
            case TransferOperation::Upload:
            case TransferOperation::Download: {
                auto type = step.operation == TransferOperation::Upload
                    ? TransferType::Upload : TransferType::Download;
                auto ids = enqueue(type, plan.hostId, step.sourcePath, step.destinationPath);
                result.jobIds.insert(result.jobIds.end(), ids.begin(), ids.end());
                break;
            }
        }
        spdlog::debug("TransferDispatcher: {} {} -> {}",
                      transferOperationToString(step.operation), step.sourcePath, step.destinationPath);
    }

    spdlog::info("TransferDispatcher: Executed {} steps, {} jobs queued",
                 plan.steps.size(), result.jobIds.size());
    return result;
}

std::vector<std::string> TransferDispatcher::enqueue(TransferType type, const std::string& hostId,
                                                     const std::string& sourcePath,
                                                     const std::string& destinationPath) {
    const bool upload = type == TransferType::Upload;
    auto remote = requireRemote(m_remoteProvider, hostId);
    auto source = upload ? m_localFs : remote;
    auto destination = upload ? remote : m_localFs;

    auto makeJob = [&](const std::string& from, const std::string& to) {
        TransferJob job;
        job.type = type;
        job.hostId = hostId;
        job.localPath = upload ? from : to;
        job.remotePath = upload ? to : from;
        job.filename = baseName(from);
        return m_queue.addJob(job).id;
    };

    std::vector<std::string> ids;
    FileEntry root = source->stat(sourcePath);
    if (!root.isDirectory()) {
        ids.push_back(makeJob(sourcePath, destinationPath));
        return ids;
    }

    // Каталог: структура создаётся сразу, файлы идут отдельными задачами
    std::vector<std::pair<std::string, std::string>> pending{{sourcePath, destinationPath}};
    while (!pending.empty()) {
        auto [fromDir, toDir] = pending.back();
        pending.pop_back();

        if (!destination->exists(toDir)) {
            destination->mkdir(toDir);
        }
        for (const auto& entry : source->listFiles(fromDir)) {
            std::string target = joinPath(toDir, entry.name);
            if (entry.isDirectory()) {
                pending.emplace_back(entry.path, target);
            } else {
                ids.push_back(makeJob(entry.path, target));
            }
        }
    }

    spdlog::info("TransferDispatcher: Directory {} expanded into {} jobs", sourcePath, ids.size());
    return ids;
}

} // namespace TwinPane

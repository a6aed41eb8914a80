// JsonCodec.cpp — JSON-представление моделей

#include "twinpane/Rpc/JsonCodec.h"
#include "twinpane/Errors.h"

namespace TwinPane {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════
// FileEntry
// ═══════════════════════════════════════════════════════════

json toJson(const FileEntry& entry) {
    json j = {
        {"name", entry.name},
        {"path", entry.path},
        {"size", entry.size},
        {"type", std::string(1, fileTypeToChar(entry.type))},
        {"modTime", entry.modTime},
        {"permissions", entry.permissions},
        {"owner", entry.owner},
        {"group", entry.group}
    };
    if (entry.symlinkTarget) {
        j["symlinkTarget"] = *entry.symlinkTarget;
    }
    return j;
}

json toJson(const std::vector<FileEntry>& entries) {
    json arr = json::array();
    for (const auto& entry : entries) {
        arr.push_back(toJson(entry));
    }
    return arr;
}

// ═══════════════════════════════════════════════════════════
// Transfers
// ═══════════════════════════════════════════════════════════

json toJson(const TransferConflict& conflict) {
    return {
        {"transferId", conflict.transferId},
        {"sourceFile", conflict.sourceFile},
        {"targetPath", conflict.targetPath},
        {"targetSize", conflict.targetSize},
        {"targetModTime", conflict.targetModTime}
    };
}

json toJson(const TransferJob& job) {
    json j = {
        {"id", job.id},
        {"type", transferTypeToString(job.type)},
        {"hostId", job.hostId},
        {"filename", job.filename},
        {"localPath", job.localPath},
        {"remotePath", job.remotePath},
        {"size", job.size},
        {"bytesTransferred", job.bytesTransferred},
        {"speed", job.speed},
        {"progress", job.progress},
        {"status", transferStatusToString(job.status)},
        {"priority", job.priority},
        {"createdAt", job.createdAt},
        {"startedAt", job.startedAt},
        {"completedAt", job.completedAt}
    };
    if (job.error) {
        j["error"] = *job.error;
    }
    if (job.conflict) {
        j["conflict"] = toJson(*job.conflict);
    }
    return j;
}

json toJson(const std::vector<TransferJob>& jobs) {
    json arr = json::array();
    for (const auto& job : jobs) {
        arr.push_back(toJson(job));
    }
    return arr;
}

json toJson(const TransferQueueSummary& summary) {
    return {
        {"activeCount", summary.activeCount},
        {"totalSpeed", summary.totalSpeed},
        {"queuedCount", summary.queuedCount}
    };
}

json toJson(const TransferStep& step) {
    return {
        {"operation", transferOperationToString(step.operation)},
        {"sourcePath", step.sourcePath},
        {"destinationPath", step.destinationPath}
    };
}

TransferJob transferJobFromJson(const json& j) {
    if (!j.is_object()) {
        throw FileOperationError(ErrorCode::InvalidParams, "Invalid params: job must be an object");
    }

    TransferJob job;
    job.id = j.value("id", "");

    std::string type = j.value("type", "");
    auto parsedType = transferTypeFromString(type);
    if (!parsedType) {
        throw FileOperationError(ErrorCode::InvalidParams, "Invalid params: unknown transfer type '" + type + "'");
    }
    job.type = *parsedType;

    job.hostId = j.value("hostId", "");
    job.filename = j.value("filename", "");
    job.localPath = j.value("localPath", "");
    job.remotePath = j.value("remotePath", "");
    job.size = j.value("size", int64_t{0});
    job.priority = j.value("priority", 1);
    job.createdAt = j.value("createdAt", int64_t{0});
    return job;
}

// ═══════════════════════════════════════════════════════════
// Panes & drops
// ═══════════════════════════════════════════════════════════

PaneState paneStateFromJson(const json& j) {
    PaneState pane;
    pane.paneId = paneIdFromString(j.value("paneId", "left"));

    std::string system = j.value("system", "");
    auto parsed = fileSystemKindFromString(system);
    if (!parsed) {
        throw FileOperationError(ErrorCode::InvalidParams, "Invalid params: unknown file system '" + system + "'");
    }
    pane.system = *parsed;
    pane.currentPath = j.value("currentPath", "");
    return pane;
}

DropRequest dropRequestFromJson(const json& j) {
    DropRequest request;
    request.hostId = j.value("hostId", "");
    request.sourcePaths = j.at("sourcePaths").get<std::vector<std::string>>();
    request.sourcePane = paneStateFromJson(j.at("sourcePane"));
    request.targetPane = paneStateFromJson(j.at("targetPane"));
    request.targetPath = j.value("targetPath", request.targetPane.currentPath);
    request.isCopy = j.value("isCopy", true);
    return request;
}

} // namespace TwinPane

#pragma once

#include "Types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TwinPane {

/// Значение symlinkTarget, если цель ссылки прочитать не удалось
constexpr const char* UNRESOLVED_SYMLINK_TARGET = "(unresolved)";

// ═══════════════════════════════════════════════════════════
// Запись каталога
// ═══════════════════════════════════════════════════════════

struct FileEntry {
    std::string name;
    std::string path;                       // Всегда с прямыми слешами
    int64_t size = 0;
    FileType type = FileType::Regular;
    int64_t modTime = 0;                    // ms since epoch
    std::string permissions;                // "drwxr-xr-x"
    std::string owner;
    std::string group;
    std::optional<std::string> symlinkTarget;

    bool isDirectory() const { return type == FileType::Directory; }
    bool isSymlink() const { return type == FileType::Symlink; }
};

// ═══════════════════════════════════════════════════════════
// Конфликт: файл назначения уже существует
// ═══════════════════════════════════════════════════════════

struct TransferConflict {
    std::string transferId;
    std::string sourceFile;
    std::string targetPath;
    int64_t targetSize = 0;
    int64_t targetModTime = 0;              // ms since epoch
};

// ═══════════════════════════════════════════════════════════
// Задача передачи
// ═══════════════════════════════════════════════════════════

struct TransferJob {
    std::string id;
    TransferType type = TransferType::Download;
    std::string hostId;
    std::string filename;
    std::string localPath;
    std::string remotePath;
    int64_t size = 0;                       // 0 = ещё неизвестен
    int64_t bytesTransferred = 0;
    double speed = 0.0;                     // bytes/sec, сглаженная
    int32_t progress = 0;                   // 0..100
    TransferStatus status = TransferStatus::Pending;
    std::optional<std::string> error;
    int32_t priority = 1;                   // Больше раньше
    int64_t createdAt = 0;
    int64_t startedAt = 0;
    int64_t completedAt = 0;
    std::optional<TransferConflict> conflict;

    bool isUpload() const { return type == TransferType::Upload; }

    const std::string& sourcePath() const { return isUpload() ? localPath : remotePath; }
    const std::string& destinationPath() const { return isUpload() ? remotePath : localPath; }

    FileSystemKind sourceSystem() const {
        return isUpload() ? FileSystemKind::Local : FileSystemKind::Remote;
    }
    FileSystemKind destinationSystem() const {
        return isUpload() ? FileSystemKind::Remote : FileSystemKind::Local;
    }
};

// Сводка очереди: вычисляется при каждом запросе, не хранится
struct TransferQueueSummary {
    int32_t activeCount = 0;
    double totalSpeed = 0.0;
    int32_t queuedCount = 0;
};

// ═══════════════════════════════════════════════════════════
// Панели и drag-and-drop
// ═══════════════════════════════════════════════════════════

struct PaneState {
    PaneId paneId = PaneId::Left;
    FileSystemKind system = FileSystemKind::Local;
    std::string currentPath;
};

struct DropRequest {
    std::string hostId;
    std::vector<std::string> sourcePaths;
    PaneState sourcePane;
    PaneState targetPane;
    std::string targetPath;
    bool isCopy = true;
};

} // namespace TwinPane

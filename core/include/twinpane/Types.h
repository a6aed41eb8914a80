#pragma once

#include "export.h"
#include <cstdint>
#include <optional>
#include <string>

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// Файловая система (system tag)
// ═══════════════════════════════════════════════════════════

enum class FileSystemKind : int32_t {
    Local = 0,      // Локальный диск
    Remote = 1      // Удалённый хост (SFTP и т.п.)
};

TP_API const char* fileSystemKindToString(FileSystemKind kind);
TP_API std::optional<FileSystemKind> fileSystemKindFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Тип узла файловой системы
// ═══════════════════════════════════════════════════════════

enum class FileType : int32_t {
    Regular = 0,
    Directory = 1,
    Symlink = 2
};

/// Символ типа в стиле ls: '-', 'd', 'l'
TP_API char fileTypeToChar(FileType type);
TP_API FileType fileTypeFromChar(char c);

// ═══════════════════════════════════════════════════════════
// Передачи
// ═══════════════════════════════════════════════════════════

enum class TransferType : int32_t {
    Upload = 0,     // local → remote
    Download = 1    // remote → local
};

TP_API const char* transferTypeToString(TransferType type);
TP_API std::optional<TransferType> transferTypeFromString(const std::string& str);

enum class TransferStatus : int32_t {
    Pending = 0,    // Ожидает в очереди
    Active = 1,     // Передаётся
    Paused = 2,     // Приостановлена (в т.ч. ждёт решения конфликта)
    Completed = 3,  // Успешно завершена
    Error = 4,      // Ошибка
    Cancelled = 5   // Отменена пользователем
};

TP_API const char* transferStatusToString(TransferStatus status);
TP_API std::optional<TransferStatus> transferStatusFromString(const std::string& str);

/// Терминальные статусы: completed, error, cancelled
TP_API bool isTerminal(TransferStatus status);

/// Решение пользователя при существующем файле назначения
enum class ConflictAction : int32_t {
    Overwrite = 0,
    Resume = 1,
    Rename = 2,
    Skip = 3
};

TP_API const char* conflictActionToString(ConflictAction action);
TP_API std::optional<ConflictAction> conflictActionFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Контрольные суммы
// ═══════════════════════════════════════════════════════════

enum class HashAlgorithm : int32_t {
    Md5 = 0,
    Sha1 = 1,
    Sha256 = 2
};

TP_API const char* hashAlgorithmToString(HashAlgorithm algorithm);
TP_API std::optional<HashAlgorithm> hashAlgorithmFromString(const std::string& str);

// ═══════════════════════════════════════════════════════════
// Панели двухпанельного браузера
// ═══════════════════════════════════════════════════════════

enum class PaneId : int32_t {
    Left = 0,
    Right = 1
};

TP_API const char* paneIdToString(PaneId pane);
TP_API PaneId paneIdFromString(const std::string& str);

} // namespace TwinPane

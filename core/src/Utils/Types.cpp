#include "twinpane/Types.h"
#include <algorithm>
#include <cctype>

namespace TwinPane {

static std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

// ═══════════════════════════════════════════════════════════
// FileSystemKind
// ═══════════════════════════════════════════════════════════

const char* fileSystemKindToString(FileSystemKind kind) {
    switch (kind) {
        case FileSystemKind::Local:  return "local";
        case FileSystemKind::Remote: return "remote";
        default:                     return "local";
    }
}

std::optional<FileSystemKind> fileSystemKindFromString(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "local")  return FileSystemKind::Local;
    if (lower == "remote") return FileSystemKind::Remote;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════
// FileType
// ═══════════════════════════════════════════════════════════

char fileTypeToChar(FileType type) {
    switch (type) {
        case FileType::Directory: return 'd';
        case FileType::Symlink:   return 'l';
        case FileType::Regular:
        default:                  return '-';
    }
}

FileType fileTypeFromChar(char c) {
    if (c == 'd') return FileType::Directory;
    if (c == 'l') return FileType::Symlink;
    return FileType::Regular;
}

// ═══════════════════════════════════════════════════════════
// TransferType / TransferStatus
// ═══════════════════════════════════════════════════════════

const char* transferTypeToString(TransferType type) {
    switch (type) {
        case TransferType::Upload:   return "upload";
        case TransferType::Download: return "download";
        default:                     return "download";
    }
}

std::optional<TransferType> transferTypeFromString(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "upload")   return TransferType::Upload;
    if (lower == "download") return TransferType::Download;
    return std::nullopt;
}

const char* transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:   return "pending";
        case TransferStatus::Active:    return "active";
        case TransferStatus::Paused:    return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Error:     return "error";
        case TransferStatus::Cancelled: return "cancelled";
        default:                        return "pending";
    }
}

std::optional<TransferStatus> transferStatusFromString(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "pending")   return TransferStatus::Pending;
    if (lower == "active")    return TransferStatus::Active;
    if (lower == "paused")    return TransferStatus::Paused;
    if (lower == "completed") return TransferStatus::Completed;
    if (lower == "error")     return TransferStatus::Error;
    if (lower == "cancelled") return TransferStatus::Cancelled;
    return std::nullopt;
}

bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Error ||
           status == TransferStatus::Cancelled;
}

// ═══════════════════════════════════════════════════════════
// ConflictAction
// ═══════════════════════════════════════════════════════════

const char* conflictActionToString(ConflictAction action) {
    switch (action) {
        case ConflictAction::Overwrite: return "overwrite";
        case ConflictAction::Resume:    return "resume";
        case ConflictAction::Rename:    return "rename";
        case ConflictAction::Skip:      return "skip";
        default:                        return "skip";
    }
}

std::optional<ConflictAction> conflictActionFromString(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "overwrite") return ConflictAction::Overwrite;
    if (lower == "resume")    return ConflictAction::Resume;
    if (lower == "rename")    return ConflictAction::Rename;
    if (lower == "skip")      return ConflictAction::Skip;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════
// HashAlgorithm
// ═══════════════════════════════════════════════════════════

const char* hashAlgorithmToString(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Md5:    return "md5";
        case HashAlgorithm::Sha1:   return "sha1";
        case HashAlgorithm::Sha256: return "sha256";
        default:                    return "sha256";
    }
}

std::optional<HashAlgorithm> hashAlgorithmFromString(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "md5")    return HashAlgorithm::Md5;
    if (lower == "sha1")   return HashAlgorithm::Sha1;
    if (lower == "sha256") return HashAlgorithm::Sha256;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════
// PaneId
// ═══════════════════════════════════════════════════════════

const char* paneIdToString(PaneId pane) {
    return pane == PaneId::Right ? "right" : "left";
}

PaneId paneIdFromString(const std::string& str) {
    return toLower(str) == "right" ? PaneId::Right : PaneId::Left;
}

} // namespace TwinPane

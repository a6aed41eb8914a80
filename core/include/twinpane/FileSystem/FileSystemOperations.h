// FileSystemOperations.h — Общий контракт локальной и удалённой файловой системы

#pragma once

#include "../export.h"
#include "../Models.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TwinPane {

// ═══════════════════════════════════════════════════════════
// Потоки для поблочной передачи
// ═══════════════════════════════════════════════════════════

class TP_API FileReader {
public:
    virtual ~FileReader() = default;

    /// Прочитать до size байт; 0 означает конец файла
    /// @throws FileOperationError при ошибке чтения
    virtual size_t read(char* buffer, size_t size) = 0;
};

class TP_API FileWriter {
public:
    virtual ~FileWriter() = default;

    /// @throws FileOperationError при ошибке записи
    virtual void write(const char* data, size_t size) = 0;

    /// Сбросить буферы и закрыть; повторный вызов безопасен
    virtual void close() = 0;
};

// ═══════════════════════════════════════════════════════════
// FileSystemOperations
// ═══════════════════════════════════════════════════════════

/// Одинаковый набор операций для локального диска и удалённого хоста.
/// Ошибки одиночных операций: FileOperationError с кодом и исходным
/// сообщением ОС; пакетные операции пропускают сбойные элементы.
class TP_API FileSystemOperations {
public:
    using ChmodProgressCallback =
        std::function<void(int64_t current, int64_t total, const std::string& path)>;

    virtual ~FileSystemOperations() = default;

    virtual FileSystemKind kind() const = 0;

    // Каталоги и метаданные
    virtual std::vector<FileEntry> listFiles(const std::string& dirPath) = 0;
    virtual FileEntry stat(const std::string& path) = 0;
    virtual bool exists(const std::string& path) = 0;

    // Изменение
    virtual void remove(const std::string& path) = 0;
    virtual void mkdir(const std::string& path) = 0;
    virtual void rename(const std::string& oldPath, const std::string& newPath) = 0;
    virtual void newFile(const std::string& path) = 0;
    virtual void copy(const std::string& sourcePath, const std::string& destinationPath) = 0;
    virtual void move(const std::string& sourcePath, const std::string& destinationPath) = 0;

    // Содержимое
    virtual std::string calculateChecksum(const std::string& path, HashAlgorithm algorithm) = 0;
    virtual std::vector<FileEntry> searchFiles(
        const std::string& basePath,
        const std::optional<std::string>& pattern,
        const std::optional<std::string>& content,
        bool recursive) = 0;

    // Ссылки и права
    virtual void createSymlink(const std::string& sourcePath, const std::string& linkPath) = 0;
    virtual std::string resolveSymlink(const std::string& linkPath) = 0;
    virtual void chmod(const std::string& path, const std::string& octalMode) = 0;
    virtual void chmodRecursive(const std::string& path, const std::string& octalMode,
                                ChmodProgressCallback onProgress) = 0;

    // Поблочный доступ для очереди передач
    virtual std::unique_ptr<FileReader> openRead(const std::string& path, int64_t offset) = 0;
    virtual std::unique_ptr<FileWriter> openWrite(const std::string& path, bool append) = 0;
};

/// Удалённая ФС по hostId; nullptr если сессии для хоста нет
using RemoteFileSystemProvider =
    std::function<std::shared_ptr<FileSystemOperations>(const std::string& hostId)>;

/// Удалённая ФС хоста
/// @throws FileOperationError(HostNotFound) если провайдера нет или он вернул nullptr
TP_API std::shared_ptr<FileSystemOperations> requireRemote(
    const RemoteFileSystemProvider& provider, const std::string& hostId);

} // namespace TwinPane

// LocalFileSystem.h — Операции с локальным диском

#pragma once

#include "FileSystemOperations.h"
#include <filesystem>

namespace TwinPane {

class TP_API LocalFileSystem : public FileSystemOperations {
public:
    LocalFileSystem() = default;

    FileSystemKind kind() const override { return FileSystemKind::Local; }

    /// Содержимое каталога: сначала каталоги, затем по имени.
    /// Элементы, для которых stat не удался, пропускаются.
    /// На Windows пустой путь или "/" даёт список дисков.
    std::vector<FileEntry> listFiles(const std::string& dirPath) override;

    FileEntry stat(const std::string& path) override;
    bool exists(const std::string& path) override;

    /// Рекурсивно для каталогов
    void remove(const std::string& path) override;

    /// Без создания промежуточных каталогов
    void mkdir(const std::string& path) override;

    void rename(const std::string& oldPath, const std::string& newPath) override;

    /// Создать пустой файл; ошибка, если путь уже занят
    void newFile(const std::string& path) override;

    /// Файлы перезаписываются; каталоги копируются обходом в глубину
    void copy(const std::string& sourcePath, const std::string& destinationPath) override;

    /// Одно переименование ОС; между устройствами не работает (EXDEV)
    void move(const std::string& sourcePath, const std::string& destinationPath) override;

    std::string calculateChecksum(const std::string& path, HashAlgorithm algorithm) override;

    /// Поиск по маске имени и (опционально) подстроке в содержимом.
    /// Нечитаемые и бинарные файлы при поиске по содержимому пропускаются.
    std::vector<FileEntry> searchFiles(
        const std::string& basePath,
        const std::optional<std::string>& pattern,
        const std::optional<std::string>& content,
        bool recursive) override;

    void createSymlink(const std::string& sourcePath, const std::string& linkPath) override;

    /// Абсолютный нормализованный путь цели; относительная цель
    /// разрешается от каталога самой ссылки
    std::string resolveSymlink(const std::string& linkPath) override;

    void chmod(const std::string& path, const std::string& octalMode) override;

    /// Сначала собирает поддерево, затем меняет права; сбойные пути пропускаются
    void chmodRecursive(const std::string& path, const std::string& octalMode,
                        ChmodProgressCallback onProgress) override;

    std::unique_ptr<FileReader> openRead(const std::string& path, int64_t offset) override;
    std::unique_ptr<FileWriter> openWrite(const std::string& path, bool append) override;

    // ═══════════════════════════════════════════════════════════
    // Только для локального диска
    // ═══════════════════════════════════════════════════════════

    std::string readFile(const std::string& path);
    void writeFile(const std::string& path, const std::string& content);

    static std::string homeDirectory();

    /// "~" → домашний каталог, "" → "/", остальное лексически нормализуется
    static std::filesystem::path resolvePath(const std::string& path);

private:
    FileEntry buildEntry(const std::filesystem::path& fullPath, const std::string& name);
};

} // namespace TwinPane

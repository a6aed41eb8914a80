// SandboxFileSystem.h — Удалённая ФС для тестов: пути "/x" живут в локальном каталоге root

#pragma once

#include "twinpane/FileSystem/LocalFileSystem.h"
#include "twinpane/FileSystem/PathUtils.h"
#include <memory>
#include <string>
#include <vector>

namespace TwinPane {

class SandboxFileSystem : public FileSystemOperations {
public:
    explicit SandboxFileSystem(const std::string& root)
        : m_root(toForwardSlashes(pathToUtf8(LocalFileSystem::resolvePath(root)))) {}

    FileSystemKind kind() const override { return FileSystemKind::Remote; }

    /// Локальный путь для удалённого
    std::string toLocal(const std::string& remotePath) const {
        return joinPath(m_root, remotePath);
    }

    std::string toRemote(const std::string& localPath) const {
        std::string p = toForwardSlashes(localPath);
        if (p.rfind(m_root, 0) != 0) return p;
        std::string rest = p.substr(m_root.size());
        return rest.empty() ? "/" : rest;
    }

    std::vector<FileEntry> listFiles(const std::string& dirPath) override {
        calls.push_back("listFiles");
        return mapEntries(m_local.listFiles(toLocal(dirPath)));
    }

    FileEntry stat(const std::string& path) override {
        calls.push_back("stat");
        return mapEntry(m_local.stat(toLocal(path)));
    }

    bool exists(const std::string& path) override {
        return m_local.exists(toLocal(path));
    }

    void remove(const std::string& path) override {
        calls.push_back("remove");
        m_local.remove(toLocal(path));
    }

    void mkdir(const std::string& path) override {
        calls.push_back("mkdir");
        m_local.mkdir(toLocal(path));
    }

    void rename(const std::string& oldPath, const std::string& newPath) override {
        calls.push_back("rename");
        m_local.rename(toLocal(oldPath), toLocal(newPath));
    }

    void newFile(const std::string& path) override {
        calls.push_back("newFile");
        m_local.newFile(toLocal(path));
    }

    void copy(const std::string& sourcePath, const std::string& destinationPath) override {
        calls.push_back("copy");
        m_local.copy(toLocal(sourcePath), toLocal(destinationPath));
    }

    void move(const std::string& sourcePath, const std::string& destinationPath) override {
        calls.push_back("move");
        m_local.move(toLocal(sourcePath), toLocal(destinationPath));
    }

    std::string calculateChecksum(const std::string& path, HashAlgorithm algorithm) override {
        calls.push_back("calculateChecksum");
        return m_local.calculateChecksum(toLocal(path), algorithm);
    }

    std::vector<FileEntry> searchFiles(const std::string& basePath,
                                       const std::optional<std::string>& pattern,
                                       const std::optional<std::string>& content,
                                       bool recursive) override {
        calls.push_back("searchFiles");
        return mapEntries(m_local.searchFiles(toLocal(basePath), pattern, content, recursive));
    }

    void createSymlink(const std::string& sourcePath, const std::string& linkPath) override {
        calls.push_back("createSymlink");
        m_local.createSymlink(toLocal(sourcePath), toLocal(linkPath));
    }

    std::string resolveSymlink(const std::string& linkPath) override {
        calls.push_back("resolveSymlink");
        return toRemote(m_local.resolveSymlink(toLocal(linkPath)));
    }

    void chmod(const std::string& path, const std::string& octalMode) override {
        calls.push_back("chmod");
        m_local.chmod(toLocal(path), octalMode);
    }

    void chmodRecursive(const std::string& path, const std::string& octalMode,
                        ChmodProgressCallback onProgress) override {
        calls.push_back("chmodRecursive");
        m_local.chmodRecursive(toLocal(path), octalMode,
            [this, onProgress](int64_t current, int64_t total, const std::string& p) {
                if (onProgress) onProgress(current, total, toRemote(p));
            });
    }

    std::unique_ptr<FileReader> openRead(const std::string& path, int64_t offset) override {
        calls.push_back("openRead");
        return m_local.openRead(toLocal(path), offset);
    }

    std::unique_ptr<FileWriter> openWrite(const std::string& path, bool append) override {
        calls.push_back("openWrite");
        return m_local.openWrite(toLocal(path), append);
    }

    std::vector<std::string> calls;

private:
    FileEntry mapEntry(FileEntry entry) const {
        entry.path = toRemote(entry.path);
        return entry;
    }

    std::vector<FileEntry> mapEntries(std::vector<FileEntry> entries) const {
        for (auto& entry : entries) {
            entry.path = toRemote(entry.path);
        }
        return entries;
    }

    std::string m_root;
    LocalFileSystem m_local;
};

} // namespace TwinPane

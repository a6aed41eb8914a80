// LocalFileSystem.cpp — Операции с локальным диском

#include "twinpane/FileSystem/LocalFileSystem.h"
#include "twinpane/FileSystem/Checksum.h"
#include "twinpane/FileSystem/PathUtils.h"
#include "twinpane/Errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace TwinPane {

namespace fs = std::filesystem;

namespace {

constexpr size_t CONTENT_SEARCH_CHUNK = 64 * 1024;

std::error_code lastErrno() {
    return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

/// status/symlink_status, бросающий FileOperationError для отсутствующего пути
fs::file_status requireStatus(const fs::path& p, const std::string& context, bool followSymlinks) {
    std::error_code ec;
    fs::file_status status = followSymlinks ? fs::status(p, ec) : fs::symlink_status(p, ec);
    if (ec) {
        throw makeFileError(context, ec);
    }
    if (!fs::exists(status)) {
        throw makeFileError(context, std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return status;
}

uint32_t requireMode(const std::string& octalMode) {
    auto mode = parseOctalMode(octalMode);
    if (!mode) {
        throw FileOperationError(ErrorCode::InvalidParams,
                                 "Invalid permission mode: " + octalMode);
    }
    return *mode;
}

/// Дочерние элементы каталога
std::vector<fs::path> listChildren(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> children;
    fs::directory_iterator it(dir, ec);
    if (ec) return children;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        children.push_back(it->path());
    }
    return children;
}

bool isInside(const fs::path& candidate, const fs::path& root) {
    auto rel = candidate.lexically_relative(root);
    return !rel.empty() && *rel.begin() != "..";
}

/// Подстрока в содержимом; false для бинарных (есть NUL) и нечитаемых файлов
bool fileContains(const fs::path& p, const std::string& needle) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;

    std::vector<char> buffer(CONTENT_SEARCH_CHUNK);
    std::string window;
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        std::string chunk(buffer.data(), static_cast<size_t>(in.gcount()));
        if (chunk.find('\0') != std::string::npos) {
            return false;
        }

        window += chunk;
        if (window.find(needle) != std::string::npos) {
            return true;
        }
        // Хвост на стыке блоков
        if (window.size() >= needle.size()) {
            window.erase(0, window.size() - needle.size() + 1);
        }
        if (in.eof()) break;
    }
    return false;
}

void sortEntries(std::vector<FileEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.isDirectory() != b.isDirectory()) {
            return a.isDirectory();
        }
        return a.name < b.name;
    });
}

#ifdef _WIN32
std::vector<FileEntry> listDrives() {
    std::vector<FileEntry> drives;
    DWORD mask = GetLogicalDrives();
    for (int i = 0; i < 26; ++i) {
        if (!(mask & (1u << i))) continue;
        std::string letter = std::string(1, static_cast<char>('A' + i)) + ":";
        FileEntry entry;
        entry.name = letter;
        entry.path = letter + "/";
        entry.type = FileType::Directory;
        entry.permissions = "drwxr-xr-x";
        drives.push_back(entry);
    }
    return drives;
}
#endif

// ═══════════════════════════════════════════════════════════
// Потоки
// ═══════════════════════════════════════════════════════════

class LocalFileReader : public FileReader {
public:
    LocalFileReader(const fs::path& path, int64_t offset)
        : m_path(pathToUtf8(path)), m_file(path, std::ios::binary) {
        if (!m_file) {
            throw makeFileError("Failed to open " + m_path, lastErrno());
        }
        if (offset > 0) {
            m_file.seekg(offset);
            if (!m_file) {
                throw FileOperationError(ErrorCode::OperationFailed,
                    "Failed to seek " + m_path + " to offset " + std::to_string(offset));
            }
        }
    }

    size_t read(char* buffer, size_t size) override {
        m_file.read(buffer, static_cast<std::streamsize>(size));
        if (m_file.bad()) {
            throw makeFileError("Failed to read " + m_path, lastErrno());
        }
        return static_cast<size_t>(m_file.gcount());
    }

private:
    std::string m_path;
    std::ifstream m_file;
};

class LocalFileWriter : public FileWriter {
public:
    LocalFileWriter(const fs::path& path, bool append)
        : m_path(pathToUtf8(path)),
          m_file(path, std::ios::binary | (append ? std::ios::app : std::ios::trunc)) {
        if (!m_file) {
            throw makeFileError("Failed to open " + m_path + " for writing", lastErrno());
        }
    }

    void write(const char* data, size_t size) override {
        m_file.write(data, static_cast<std::streamsize>(size));
        if (!m_file) {
            throw makeFileError("Failed to write " + m_path, lastErrno());
        }
    }

    void close() override {
        if (!m_file.is_open()) return;
        m_file.close();
        if (m_file.fail()) {
            throw makeFileError("Failed to close " + m_path, lastErrno());
        }
    }

private:
    std::string m_path;
    std::ofstream m_file;
};

} // namespace

// ═══════════════════════════════════════════════════════════
// Пути
// ═══════════════════════════════════════════════════════════

std::string LocalFileSystem::homeDirectory() {
#ifdef _WIN32
    if (const char* profile = std::getenv("USERPROFILE")) {
        return toForwardSlashes(profile);
    }
    return "C:/";
#else
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "/";
#endif
}

fs::path LocalFileSystem::resolvePath(const std::string& path) {
    if (path.empty()) {
        return fs::path("/");
    }

    std::string expanded = path;
    if (path == "~") {
        expanded = homeDirectory();
    } else if (path.rfind("~/", 0) == 0) {
        expanded = joinPath(homeDirectory(), path.substr(2));
    }

    fs::path p = utf8ToPath(expanded).lexically_normal();
    if (!p.has_filename() && p != p.root_path() && p.has_parent_path()) {
        p = p.parent_path();  // "/a/b/" → "/a/b"
    }
    return p;
}

// ═══════════════════════════════════════════════════════════
// Метаданные
// ═══════════════════════════════════════════════════════════

FileEntry LocalFileSystem::buildEntry(const fs::path& fullPath, const std::string& name) {
    FileEntry entry;
    entry.name = name;
    entry.path = toForwardSlashes(pathToUtf8(fullPath));

#ifdef _WIN32
    auto status = requireStatus(fullPath, "Failed to stat " + entry.path, false);
    std::error_code ec;
    if (fs::is_symlink(status)) {
        entry.type = FileType::Symlink;
    } else if (fs::is_directory(status)) {
        entry.type = FileType::Directory;
    }
    if (fs::is_regular_file(status)) {
        entry.size = static_cast<int64_t>(fs::file_size(fullPath, ec));
    }
    auto ftime = fs::last_write_time(fullPath, ec);
    if (!ec) {
        auto sctp = std::chrono::clock_cast<std::chrono::system_clock>(ftime);
        entry.modTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            sctp.time_since_epoch()).count();
    }
    uint32_t mode = entry.isDirectory() ? 0755 : 0644;
    entry.permissions = buildPermissionsString(mode, entry.type);
#else
    struct stat st;
    if (::lstat(fullPath.c_str(), &st) != 0) {
        throw makeFileError("Failed to stat " + entry.path, lastErrno());
    }

    if (S_ISLNK(st.st_mode)) {
        entry.type = FileType::Symlink;
    } else if (S_ISDIR(st.st_mode)) {
        entry.type = FileType::Directory;
    }
    entry.size = static_cast<int64_t>(st.st_size);

#ifdef __APPLE__
    entry.modTime = static_cast<int64_t>(st.st_mtimespec.tv_sec) * 1000 +
                    st.st_mtimespec.tv_nsec / 1000000;
#else
    entry.modTime = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
                    st.st_mtim.tv_nsec / 1000000;
#endif

    entry.permissions = buildPermissionsString(static_cast<uint32_t>(st.st_mode), entry.type);
    entry.owner = std::to_string(st.st_uid);
    entry.group = std::to_string(st.st_gid);
#endif

    if (entry.isSymlink()) {
        std::error_code ec;
        auto target = fs::read_symlink(fullPath, ec);
        entry.symlinkTarget = ec ? std::string(UNRESOLVED_SYMLINK_TARGET)
                                 : toForwardSlashes(pathToUtf8(target));
#ifndef _WIN32
        // Размер цели, а не самой ссылки
        struct stat targetStat;
        if (::stat(fullPath.c_str(), &targetStat) == 0) {
            entry.size = static_cast<int64_t>(targetStat.st_size);
        }
#endif
    }
    return entry;
}

std::vector<FileEntry> LocalFileSystem::listFiles(const std::string& dirPath) {
#ifdef _WIN32
    if (dirPath.empty() || dirPath == "/") {
        return listDrives();
    }
#endif
    fs::path dir = resolvePath(dirPath);

    std::error_code ec;
    auto children = listChildren(dir, ec);
    if (ec && children.empty()) {
        throw makeFileError("Failed to list directory " + pathToUtf8(dir), ec);
    }
    if (ec) {
        spdlog::warn("LocalFileSystem: Listing of {} stopped early: {}", pathToUtf8(dir), ec.message());
    }

    std::vector<FileEntry> entries;
    entries.reserve(children.size());
    for (const auto& child : children) {
        std::string name = pathToUtf8(child.filename());
        try {
            entries.push_back(buildEntry(child, name));
        } catch (const FileOperationError& e) {
            spdlog::warn("LocalFileSystem: Skipping {}: {}", name, e.what());
        }
    }

    sortEntries(entries);
    spdlog::debug("LocalFileSystem: Listed {} entries in {}", entries.size(), pathToUtf8(dir));
    return entries;
}

FileEntry LocalFileSystem::stat(const std::string& path) {
    fs::path p = resolvePath(path);
    return buildEntry(p, baseName(pathToUtf8(p)));
}

bool LocalFileSystem::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(resolvePath(path), ec));
}

// ═══════════════════════════════════════════════════════════
// Изменение
// ═══════════════════════════════════════════════════════════

void LocalFileSystem::remove(const std::string& path) {
    fs::path p = resolvePath(path);
    const std::string context = "Failed to delete " + pathToUtf8(p);
    auto status = requireStatus(p, context, false);

    std::error_code ec;
    if (fs::is_directory(status)) {
        fs::remove_all(p, ec);
    } else {
        fs::remove(p, ec);
    }
    if (ec) {
        throw makeFileError(context, ec);
    }
    spdlog::debug("LocalFileSystem: Deleted {}", pathToUtf8(p));
}

void LocalFileSystem::mkdir(const std::string& path) {
    fs::path p = resolvePath(path);
    std::error_code ec;
    if (!fs::create_directory(p, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::file_exists);
        }
        throw makeFileError("Failed to create directory " + pathToUtf8(p), ec);
    }
}

void LocalFileSystem::rename(const std::string& oldPath, const std::string& newPath) {
    fs::path from = resolvePath(oldPath);
    fs::path to = resolvePath(newPath);
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw makeFileError("Failed to rename " + pathToUtf8(from) + " to " + pathToUtf8(to), ec);
    }
}

void LocalFileSystem::newFile(const std::string& path) {
    fs::path p = resolvePath(path);
    const std::string context = "Failed to create file " + pathToUtf8(p);
    if (exists(path)) {
        throw makeFileError(context, std::make_error_code(std::errc::file_exists));
    }
    std::ofstream out(p, std::ios::binary);
    if (!out) {
        throw makeFileError(context, lastErrno());
    }
}

void LocalFileSystem::copy(const std::string& sourcePath, const std::string& destinationPath) {
    fs::path from = resolvePath(sourcePath);
    fs::path to = resolvePath(destinationPath);
    const std::string context = "Failed to copy " + pathToUtf8(from) + " to " + pathToUtf8(to);

    auto copyEntry = [&context](const fs::path& src, const fs::path& dst, fs::file_status status) {
        std::error_code ec;
        if (fs::is_symlink(status)) {
            fs::remove(dst, ec);
            ec.clear();
            fs::copy_symlink(src, dst, ec);
        } else {
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            throw makeFileError(context, ec);
        }
    };

    auto rootStatus = requireStatus(from, context, false);
    if (!fs::is_directory(rootStatus)) {
        copyEntry(from, to, rootStatus);
        return;
    }

    if (isInside(to, from)) {
        throw FileOperationError(ErrorCode::InvalidParams,
                                 context + ": destination is inside the source directory");
    }

    // Обход в глубину: (исходный каталог, каталог назначения)
    std::vector<std::pair<fs::path, fs::path>> work{{from, to}};
    while (!work.empty()) {
        auto [srcDir, dstDir] = work.back();
        work.pop_back();

        std::error_code ec;
        fs::create_directories(dstDir, ec);
        if (ec) {
            throw makeFileError(context, ec);
        }

        auto children = listChildren(srcDir, ec);
        if (ec) {
            throw makeFileError(context, ec);
        }

        std::vector<std::pair<fs::path, fs::path>> subdirs;
        for (const auto& child : children) {
            auto status = fs::symlink_status(child, ec);
            if (ec) {
                throw makeFileError(context, ec);
            }
            fs::path target = dstDir / child.filename();
            if (fs::is_directory(status)) {
                subdirs.emplace_back(child, target);
            } else {
                copyEntry(child, target, status);
            }
        }
        work.insert(work.end(), subdirs.rbegin(), subdirs.rend());
    }
    spdlog::debug("LocalFileSystem: Copied {} to {}", pathToUtf8(from), pathToUtf8(to));
}

void LocalFileSystem::move(const std::string& sourcePath, const std::string& destinationPath) {
    fs::path from = resolvePath(sourcePath);
    fs::path to = resolvePath(destinationPath);
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        throw makeFileError("Failed to move " + pathToUtf8(from) + " to " + pathToUtf8(to), ec);
    }
    spdlog::debug("LocalFileSystem: Moved {} to {}", pathToUtf8(from), pathToUtf8(to));
}

// ═══════════════════════════════════════════════════════════
// Содержимое
// ═══════════════════════════════════════════════════════════

std::string LocalFileSystem::calculateChecksum(const std::string& path, HashAlgorithm algorithm) {
    return computeFileChecksum(pathToUtf8(resolvePath(path)), algorithm);
}

std::vector<FileEntry> LocalFileSystem::searchFiles(
    const std::string& basePath,
    const std::optional<std::string>& pattern,
    const std::optional<std::string>& content,
    bool recursive)
{
    fs::path base = resolvePath(basePath);
    requireStatus(base, "Failed to search " + pathToUtf8(base), true);

    std::optional<std::regex> nameRegex;
    if (pattern && !pattern->empty()) {
        nameRegex = compileGlob(*pattern);
    }
    const bool hasContent = content && !content->empty();

    std::vector<FileEntry> results;
    std::vector<fs::path> pending{base};

    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        std::error_code ec;
        auto children = listChildren(dir, ec);
        if (ec) {
            spdlog::warn("LocalFileSystem: Cannot read directory {}: {}", pathToUtf8(dir), ec.message());
            if (children.empty()) continue;
        }
        std::sort(children.begin(), children.end());

        std::vector<fs::path> subdirs;
        for (const auto& child : children) {
            std::string name = pathToUtf8(child.filename());
            auto status = fs::symlink_status(child, ec);
            if (ec) {
                spdlog::warn("LocalFileSystem: Skipping {}: {}", name, ec.message());
                continue;
            }

            if (recursive && fs::is_directory(status)) {
                subdirs.push_back(child);
            }

            if (nameRegex && !std::regex_match(name, *nameRegex)) {
                continue;
            }
            if (hasContent && (!fs::is_regular_file(status) || !fileContains(child, *content))) {
                continue;
            }

            try {
                results.push_back(buildEntry(child, name));
            } catch (const FileOperationError& e) {
                spdlog::warn("LocalFileSystem: Skipping {}: {}", name, e.what());
            }
        }
        pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
    }

    spdlog::debug("LocalFileSystem: Search in {} found {} entries", pathToUtf8(base), results.size());
    return results;
}

// ═══════════════════════════════════════════════════════════
// Ссылки и права
// ═══════════════════════════════════════════════════════════

void LocalFileSystem::createSymlink(const std::string& sourcePath, const std::string& linkPath) {
    fs::path source = resolvePath(sourcePath);
    fs::path link = resolvePath(linkPath);
    std::error_code ec;

#ifdef _WIN32
    fs::path linkTarget = source.is_absolute() ? source : link.parent_path() / source;
    if (fs::is_directory(linkTarget, ec)) {
        fs::create_directory_symlink(source, link, ec);
    } else {
        fs::create_symlink(source, link, ec);
    }
#else
    fs::create_symlink(source, link, ec);
#endif

    if (ec) {
        throw makeFileError("Failed to create symlink " + pathToUtf8(link), ec);
    }
}

std::string LocalFileSystem::resolveSymlink(const std::string& linkPath) {
    const std::string context = "Failed to resolve symlink " + linkPath;
    std::error_code ec;

    fs::path link = fs::absolute(resolvePath(linkPath), ec);
    if (ec) {
        throw makeFileError(context, ec);
    }

    fs::path target = fs::read_symlink(link, ec);
    if (ec) {
        throw makeFileError(context, ec);
    }
    if (target.is_relative()) {
        target = link.parent_path() / target;
    }
    return toForwardSlashes(pathToUtf8(target.lexically_normal()));
}

void LocalFileSystem::chmod(const std::string& path, const std::string& octalMode) {
#ifdef _WIN32
    (void)path;
    (void)octalMode;
    throw FileOperationError(ErrorCode::OperationFailed,
                             "Changing permissions is not supported on this platform");
#else
    uint32_t mode = requireMode(octalMode);
    fs::path p = resolvePath(path);
    std::error_code ec;
    fs::permissions(p, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    if (ec) {
        throw makeFileError("Failed to change permissions of " + pathToUtf8(p), ec);
    }
#endif
}

void LocalFileSystem::chmodRecursive(const std::string& path, const std::string& octalMode,
                                     ChmodProgressCallback onProgress) {
#ifdef _WIN32
    (void)path;
    (void)octalMode;
    (void)onProgress;
    throw FileOperationError(ErrorCode::OperationFailed,
                             "Changing permissions is not supported on this platform");
#else
    uint32_t mode = requireMode(octalMode);
    fs::path root = resolvePath(path);
    auto rootStatus = requireStatus(root, "Failed to change permissions of " + pathToUtf8(root), false);

    // Сначала собираем поддерево
    std::vector<fs::path> targets{root};
    if (fs::is_directory(rootStatus)) {
        std::vector<fs::path> pending{root};
        while (!pending.empty()) {
            fs::path dir = pending.back();
            pending.pop_back();

            std::error_code ec;
            auto children = listChildren(dir, ec);
            if (ec) {
                spdlog::warn("LocalFileSystem: Cannot read directory {}: {}", pathToUtf8(dir), ec.message());
            }
            for (const auto& child : children) {
                targets.push_back(child);
                if (fs::is_directory(fs::symlink_status(child, ec))) {
                    pending.push_back(child);
                }
            }
        }
    }

    const auto total = static_cast<int64_t>(targets.size());
    int64_t current = 0;
    for (const auto& target : targets) {
        std::error_code ec;
        fs::permissions(target, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
        if (ec) {
            spdlog::warn("LocalFileSystem: chmod failed for {}: {}", pathToUtf8(target), ec.message());
            continue;
        }
        ++current;
        if (onProgress) {
            onProgress(current, total, pathToUtf8(target));
        }
    }
    spdlog::info("LocalFileSystem: Applied mode {} to {}/{} paths under {}",
                 octalMode, current, total, pathToUtf8(root));
#endif
}

// ═══════════════════════════════════════════════════════════
// Потоки и целые файлы
// ═══════════════════════════════════════════════════════════

std::unique_ptr<FileReader> LocalFileSystem::openRead(const std::string& path, int64_t offset) {
    fs::path p = resolvePath(path);
    const std::string context = "Failed to open " + pathToUtf8(p);
    auto status = requireStatus(p, context, true);
    if (fs::is_directory(status)) {
        throw makeFileError(context, std::make_error_code(std::errc::is_a_directory));
    }
    return std::make_unique<LocalFileReader>(p, offset);
}

std::unique_ptr<FileWriter> LocalFileSystem::openWrite(const std::string& path, bool append) {
    return std::make_unique<LocalFileWriter>(resolvePath(path), append);
}

std::string LocalFileSystem::readFile(const std::string& path) {
    auto reader = openRead(path, 0);
    std::string content;
    std::vector<char> buffer(CONTENT_SEARCH_CHUNK);
    while (size_t n = reader->read(buffer.data(), buffer.size())) {
        content.append(buffer.data(), n);
    }
    return content;
}

void LocalFileSystem::writeFile(const std::string& path, const std::string& content) {
    auto writer = openWrite(path, false);
    writer->write(content.data(), content.size());
    writer->close();
}

} // namespace TwinPane

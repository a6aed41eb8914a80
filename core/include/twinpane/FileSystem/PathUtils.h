// PathUtils.h — Работа с путями, масками и правами доступа

#pragma once

#include "../export.h"
#include "../Types.h"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <regex>
#include <string>

namespace TwinPane {

/// UTF-8 представление пути с прямыми слешами
TP_API std::string pathToUtf8(const std::filesystem::path& p);
TP_API std::filesystem::path utf8ToPath(const std::string& s);

/// Заменить '\\' на '/'
TP_API std::string toForwardSlashes(const std::string& path);

/// Последний компонент пути (понимает оба вида слешей, игнорирует хвостовые)
TP_API std::string baseName(const std::string& path);

/// "dir" + "/" + "name" без двойных слешей
TP_API std::string joinPath(const std::string& dir, const std::string& name);

/// Родительский каталог ("/a/b" → "/a", "/a" → "/")
TP_API std::string parentPath(const std::string& path);

/// "file.txt", n=2 → "file (2).txt"; точка в начале имени не считается расширением
TP_API std::string numberedPath(const std::string& path, int n);

/// Первый свободный "name (N).ext" начиная с N=1
TP_API std::string nextFreePath(const std::string& path,
                                const std::function<bool(const std::string&)>& exists);

// ═══════════════════════════════════════════════════════════
// Маски имён
// ═══════════════════════════════════════════════════════════

/// Glob → regex: '*' → ".*", '?' → ".", прочие метасимволы экранируются
TP_API std::string globToRegexPattern(const std::string& glob);

/// Скомпилированная маска: без учёта регистра, якорится на всё имя
TP_API std::regex compileGlob(const std::string& glob);

TP_API bool matchesGlob(const std::string& name, const std::string& glob);

// ═══════════════════════════════════════════════════════════
// Права доступа
// ═══════════════════════════════════════════════════════════

/// 10 символов: тип + 3×rwx ("drwxr-xr-x")
TP_API std::string buildPermissionsString(uint32_t mode, FileType type);

/// "755" / "0644" → mode; nullopt если не [0-7]{3,4}
TP_API std::optional<uint32_t> parseOctalMode(const std::string& octal);

} // namespace TwinPane

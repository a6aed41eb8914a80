// PathUtils.cpp — Работа с путями, масками и правами доступа

#include "twinpane/FileSystem/PathUtils.h"
#include <algorithm>

#ifdef _WIN32
#include <windows.h>
#endif

namespace TwinPane {

namespace fs = std::filesystem;

std::string pathToUtf8(const fs::path& p) {
#ifdef _WIN32
    auto u8str = p.u8string();
    return toForwardSlashes(std::string(u8str.begin(), u8str.end()));
#else
    return p.string();
#endif
}

fs::path utf8ToPath(const std::string& s) {
#ifdef _WIN32
    if (s.empty()) return fs::path();

    int wlen = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, nullptr, 0);
    if (wlen <= 0) return fs::path(s);

    std::wstring wstr(wlen - 1, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.c_str(), -1, &wstr[0], wlen);
    return fs::path(wstr);
#else
    return fs::path(s);
#endif
}

std::string toForwardSlashes(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string baseName(const std::string& path) {
    std::string p = toForwardSlashes(path);
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return p;
    if (pos == p.size() - 1) return p;  // "/"
    return p.substr(pos + 1);
}

std::string joinPath(const std::string& dir, const std::string& name) {
    std::string d = toForwardSlashes(dir);
    while (!d.empty() && d.back() == '/') {
        d.pop_back();
    }
    std::string n = name;
    while (!n.empty() && n.front() == '/') {
        n.erase(n.begin());
    }
    return d + "/" + n;
}

std::string parentPath(const std::string& path) {
    std::string p = toForwardSlashes(path);
    while (p.size() > 1 && p.back() == '/') {
        p.pop_back();
    }
    auto pos = p.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return p.substr(0, pos);
}

std::string numberedPath(const std::string& path, int n) {
    std::string p = toForwardSlashes(path);
    auto slash = p.find_last_of('/');
    std::string dir = slash == std::string::npos ? "" : p.substr(0, slash + 1);
    std::string name = slash == std::string::npos ? p : p.substr(slash + 1);

    std::string stem = name;
    std::string ext;
    auto dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        stem = name.substr(0, dot);
        ext = name.substr(dot);
    }
    return dir + stem + " (" + std::to_string(n) + ")" + ext;
}

std::string nextFreePath(const std::string& path,
                         const std::function<bool(const std::string&)>& exists) {
    for (int n = 1;; ++n) {
        std::string candidate = numberedPath(path, n);
        if (!exists(candidate)) {
            return candidate;
        }
    }
}

// ═══════════════════════════════════════════════════════════
// Маски имён
// ═══════════════════════════════════════════════════════════

std::string globToRegexPattern(const std::string& glob) {
    static const std::string special = ".+^$()[]{}|\\";

    std::string regex;
    regex.reserve(glob.size() * 2);
    for (char c : glob) {
        if (c == '*') {
            regex += ".*";
        } else if (c == '?') {
            regex += '.';
        } else if (special.find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }
    return regex;
}

std::regex compileGlob(const std::string& glob) {
    return std::regex(globToRegexPattern(glob),
                      std::regex::ECMAScript | std::regex::icase);
}

bool matchesGlob(const std::string& name, const std::string& glob) {
    return std::regex_match(name, compileGlob(glob));
}

// ═══════════════════════════════════════════════════════════
// Права доступа
// ═══════════════════════════════════════════════════════════

std::string buildPermissionsString(uint32_t mode, FileType type) {
    std::string result(1, fileTypeToChar(type));

    static const uint32_t bits[9] = {
        0400, 0200, 0100,   // owner
        0040, 0020, 0010,   // group
        0004, 0002, 0001    // other
    };
    static const char letters[3] = {'r', 'w', 'x'};

    for (int i = 0; i < 9; ++i) {
        result += (mode & bits[i]) ? letters[i % 3] : '-';
    }
    return result;
}

std::optional<uint32_t> parseOctalMode(const std::string& octal) {
    if (octal.size() < 3 || octal.size() > 4) {
        return std::nullopt;
    }
    uint32_t mode = 0;
    for (char c : octal) {
        if (c < '0' || c > '7') {
            return std::nullopt;
        }
        mode = mode * 8 + static_cast<uint32_t>(c - '0');
    }
    return mode;
}

} // namespace TwinPane

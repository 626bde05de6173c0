#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/fs.h — Node-style synchronous file system helpers
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace s2dm::fs {

inline std::string readFileSync(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("ENOENT: no such file or directory, open '" + path + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

inline void writeFileSync(const std::string& path, const std::string& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("EACCES: permission denied, open '" + path + "'");
    }
    file << data;
    file.flush();
    if (!file) {
        throw std::runtime_error("EIO: i/o error, write '" + path + "'");
    }
}

inline bool existsSync(const std::string& path) {
    return std::filesystem::exists(path);
}

inline bool isDirectorySync(const std::string& path) {
    return std::filesystem::is_directory(path);
}

inline void mkdirSync(const std::string& path, bool recursive = false) {
    if (recursive) {
        std::filesystem::create_directories(path);
    } else {
        std::filesystem::create_directory(path);
    }
}

inline void unlinkSync(const std::string& path) {
    if (!std::filesystem::remove(path)) {
        throw std::runtime_error("ENOENT: no such file or directory, unlink '" + path + "'");
    }
}

inline void renameSync(const std::string& oldPath, const std::string& newPath) {
    std::filesystem::rename(oldPath, newPath);
}

// ── walkSync ── Regular files below `dir` whose extension is in `extensions`,
//    sorted by path so the result does not depend on directory order
inline std::vector<std::string> walkSync(const std::string& dir,
                                         const std::vector<std::string>& extensions) {
    std::vector<std::string> result;
    for (auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        auto ext = entry.path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            result.push_back(entry.path().string());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace s2dm::fs

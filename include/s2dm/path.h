#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/path.h — Node-style path utilities
// ═══════════════════════════════════════════════════════════════════

#include <filesystem>
#include <string>

namespace s2dm::path {

// ── path::join ── Variadic join of path segments
template <typename... Args>
std::string join(const std::string& first, const Args&... rest) {
    std::filesystem::path result(first);
    ((result /= rest), ...);
    return result.string();
}

// ── path::basename ── Get the filename component
inline std::string basename(const std::string& p) {
    return std::filesystem::path(p).filename().string();
}

// ── path::extname ── Extension including the dot, or ""
inline std::string extname(const std::string& p) {
    return std::filesystem::path(p).extension().string();
}

// ── path::isUrl ── Remote schema sources
inline bool isUrl(const std::string& p) {
    return p.rfind("http://", 0) == 0 || p.rfind("https://", 0) == 0;
}

} // namespace s2dm::path

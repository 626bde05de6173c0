#pragma once
// ═══════════════════════════════════════════════════════════════════
//  s2dm/console.h — Leveled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Warn);   // --quiet
//    console::info("Materialized", count, "triples");
//    console::warn("Schema has no retained type definitions");
//
//  warn/error go to stderr, the rest to stdout.
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

namespace s2dm::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Green   = "\033[32m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(Level::Info)};
    return level;
}

inline std::atomic<bool>& colorsEnabled() {
    static std::atomic<bool> enabled{true};
    return enabled;
}

// Emission may run on worker threads; keep lines whole
inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (static_cast<int>(level) < threshold().load()) return;

    std::ostringstream line;
    bool colors = colorsEnabled().load();
    if (colors) line << Colors::Gray;
    line << "[" << timestamp() << "] ";
    if (colors) line << color;
    line << prefix;
    if (colors) line << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);

    std::lock_guard<std::mutex> lock(outputMutex());
    os << line.str() << std::endl;
}

} // namespace detail

inline void setLevel(Level level) { detail::threshold().store(static_cast<int>(level)); }
inline Level level() { return static_cast<Level>(detail::threshold().load()); }
inline void setColors(bool enabled) { detail::colorsEnabled().store(enabled); }

// ── console::log ──
template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

// ── console::success ──
template <typename... Args>
void success(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Green, "✔ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

// ── console::time / console::timeEnd ──
namespace detail {
    inline std::unordered_map<std::string, std::chrono::steady_clock::time_point>& timers() {
        static std::unordered_map<std::string, std::chrono::steady_clock::time_point> t;
        return t;
    }
}

inline void time(const std::string& label) {
    detail::timers()[label] = std::chrono::steady_clock::now();
}

inline void timeEnd(const std::string& label) {
    auto it = detail::timers().find(label);
    if (it == detail::timers().end()) {
        warn("Timer '" + label + "' does not exist");
        return;
    }
    auto elapsed = std::chrono::steady_clock::now() - it->second;
    auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    debug(label + ":", std::to_string(ms) + "ms");
    detail::timers().erase(it);
}

} // namespace s2dm::console

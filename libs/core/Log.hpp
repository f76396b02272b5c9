#pragma once
// ─────────────────────────────────────────────────────────────
// Log – fmt-based line logger for the core calculators.
//   [2024-06-01 12:00:00.000123][WARN][risk][RiskCalculator.cpp:17] message
// Level comes from VANTAGE_LOG (trace|debug|info|warn|error|off),
// otherwise from the config file, otherwise the build default.
// ─────────────────────────────────────────────────────────────
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string_view>
#include "StringUtils.hpp"

namespace Vantage::Log {

enum class Level { TRACE = 0, DEBUG, INFO, WARN, ERROR, OFF };

inline std::optional<Level> levelFromString(std::string_view text) {
    auto s = StringUtils::trim(text);
    if (StringUtils::equalsIgnoreCase(s, "trace")) return Level::TRACE;
    if (StringUtils::equalsIgnoreCase(s, "debug")) return Level::DEBUG;
    if (StringUtils::equalsIgnoreCase(s, "info"))  return Level::INFO;
    if (StringUtils::equalsIgnoreCase(s, "warn") || StringUtils::equalsIgnoreCase(s, "warning")) return Level::WARN;
    if (StringUtils::equalsIgnoreCase(s, "error")) return Level::ERROR;
    if (StringUtils::equalsIgnoreCase(s, "off"))   return Level::OFF;
    return std::nullopt;
}

inline std::atomic<Level>& levelStorage() {
    static std::atomic<Level> level{[] {
#ifdef NDEBUG
        Level def = Level::INFO;
#else
        Level def = Level::DEBUG;
#endif
        if (const char* env = std::getenv("VANTAGE_LOG")) {
            return levelFromString(env).value_or(def);
        }
        return def;
    }()};
    return level;
}

inline Level currentLevel() { return levelStorage().load(std::memory_order_relaxed); }
inline void setLevel(Level level) { levelStorage().store(level, std::memory_order_relaxed); }

// Config-file level; VANTAGE_LOG takes precedence. Returns false for an unknown name.
inline bool applyConfiguredLevel(std::string_view configured) {
    auto level = levelFromString(configured);
    if (!level) return false;
    if (!std::getenv("VANTAGE_LOG")) setLevel(*level);
    return true;
}

inline const char* toString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF:   return "OFF";
    }
    return "ERROR";
}

inline std::string_view baseName(std::string_view file) {
    size_t pos = file.find_last_of("/\\");
    return pos == std::string_view::npos ? file : file.substr(pos + 1);
}

inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

template <class... Args>
inline void log(Level lvl, std::string_view category, const char* file, int line,
                fmt::format_string<Args...> pattern, Args&&... args) {
    if (lvl == Level::OFF || lvl < currentLevel()) return;
    const auto now = std::chrono::system_clock::now();
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
    const auto msg = fmt::format(pattern, std::forward<Args>(args)...);

    std::lock_guard<std::mutex> lock(outputMutex());
    fmt::print(stderr, "[{:%Y-%m-%d %H:%M:%S}.{:06}][{}][{}][{}:{}] {}\n",
               std::chrono::floor<std::chrono::seconds>(now), us,
               toString(lvl), category, baseName(file), line, msg);
}

} // namespace Vantage::Log

#define VANTAGE_LOG_AT(level, cat, pattern, ...) \
    ::Vantage::Log::log(::Vantage::Log::Level::level, cat, __FILE__, __LINE__, pattern __VA_OPT__(, ) __VA_ARGS__)
#define LOG_T(cat, pattern, ...) VANTAGE_LOG_AT(TRACE, cat, pattern, __VA_ARGS__)
#define LOG_D(cat, pattern, ...) VANTAGE_LOG_AT(DEBUG, cat, pattern, __VA_ARGS__)
#define LOG_I(cat, pattern, ...) VANTAGE_LOG_AT(INFO,  cat, pattern, __VA_ARGS__)
#define LOG_W(cat, pattern, ...) VANTAGE_LOG_AT(WARN,  cat, pattern, __VA_ARGS__)
#define LOG_E(cat, pattern, ...) VANTAGE_LOG_AT(ERROR, cat, pattern, __VA_ARGS__)

#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// VANTAGE LOGGING CATEGORIES
// =============================================================================
// Qt-facing modules (renderer, CLI) log through these categories.
// Core calculators use the fmt-based macros in Log.hpp instead.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: init, lifecycle, config
Q_DECLARE_LOGGING_CATEGORY(logRender)   // Render: scene composition, rasterization, persistence
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

namespace vantage::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp    = 1;    // Log every app event
    inline constexpr int kRender = 1;    // Render calls are per-candle-close, not per-frame
    inline constexpr int kDebug  = 10;   // Log every 10th debug message
}

#define VLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("VANTAGE_LOG_" #cat "_INTERVAL");         \
            int parsed = env ? std::atoi(env) : (defaultInterval);                   \
            return parsed > 0 ? parsed : 1;                                          \
        }();                                                                         \
        if ((++_counter % _interval) == 1 || _interval == 1) {                       \
            qCDebug(log##cat) << __VA_ARGS__;                                        \
        }                                                                            \
    } while(false)

#define vLog_App(...)     VLOG_THROTTLED(App, vantage::log_throttle::kApp, __VA_ARGS__)
#define vLog_Render(...)  VLOG_THROTTLED(Render, vantage::log_throttle::kRender, __VA_ARGS__)
#define vLog_Debug(...)   VLOG_THROTTLED(Debug, vantage::log_throttle::kDebug, __VA_ARGS__)

#define vLog_RenderN(n, ...) VLOG_THROTTLED(Render, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define vLog_Warning(...)  qCWarning(logApp) << __VA_ARGS__
#define vLog_Error(...)    qCCritical(logApp) << __VA_ARGS__

/*
USAGE:
vLog_App("Loaded config from" << path);
vLog_Render("Rasterized" << scene.series.size() << "series");
vLog_Error("Failed to persist chart:" << path);

RUNTIME CONTROL:
export VANTAGE_LOG_Render_INTERVAL=10  # Log every 10th render
export QT_LOGGING_RULES="vantage.*.debug=true"
*/

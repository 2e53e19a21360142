#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <QString>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// TAPLINE LOGGING CATEGORIES
// =============================================================================
// Four categories, each with atomic throttling for high-frequency call sites.

Q_DECLARE_LOGGING_CATEGORY(logApp)      // Application: lifecycle, config, auth, session state
Q_DECLARE_LOGGING_CATEGORY(logData)     // Data: transport, frames, dispatch, handlers
Q_DECLARE_LOGGING_CATEGORY(logStore)    // Store: write-behind queue, SQLite, queries
Q_DECLARE_LOGGING_CATEGORY(logDebug)    // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING SYSTEM
// =============================================================================

namespace tapline::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp   = 1;    // Every app event (low frequency)
    inline constexpr int kData  = 50;   // Every 50th data operation
    inline constexpr int kStore = 20;   // Every 20th store operation
    inline constexpr int kDebug = 10;   // Every 10th debug message
}

// Atomic throttling macro with runtime env var override
#define TLOG_THROTTLED(cat, defaultInterval, ...)                                   \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("TAPLINE_LOG_" #cat "_INTERVAL");         \
            const int v = env ? std::atoi(env) : (defaultInterval);                 \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if ((++_counter % _interval) == 1 || _interval == 1) {                      \
            qCInfo(log##cat).noquote() << __VA_ARGS__;                                         \
        }                                                                            \
    } while(false)

// Primary logging macros (throttled for hot paths)
#define tLog_App(...)     TLOG_THROTTLED(App, tapline::log_throttle::kApp, __VA_ARGS__)
#define tLog_Data(...)    TLOG_THROTTLED(Data, tapline::log_throttle::kData, __VA_ARGS__)
#define tLog_Store(...)   TLOG_THROTTLED(Store, tapline::log_throttle::kStore, __VA_ARGS__)
#define tLog_Debug(...)   qCDebug(logDebug).noquote() << __VA_ARGS__

// Override macros for specific throttle intervals
#define tLog_AppN(n, ...)    TLOG_THROTTLED(App, n, __VA_ARGS__)
#define tLog_DataN(n, ...)   TLOG_THROTTLED(Data, n, __VA_ARGS__)
#define tLog_StoreN(n, ...)  TLOG_THROTTLED(Store, n, __VA_ARGS__)

// Always-on macros (no throttling for critical messages)
#define tLog_Warning(...)  qCWarning(logApp).noquote() << __VA_ARGS__
#define tLog_Error(...)    qCCritical(logApp).noquote() << __VA_ARGS__

// Runtime control:
//   export TAPLINE_LOG_Data_INTERVAL=1      # every data message
//   export QT_LOGGING_RULES="tapline.debug=true"

#pragma once

// Tags name the component that logs: the driver ("sqlite", "postgres") for
// connections and statements, "migration" / "migrator" / "tags" for the
// ledger, "schema" for snapshots. Rendered SQL goes out at debug level only.

#include <atomic>
#include <cstdio>

namespace dbal {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level, defined in src/lib.cpp. Defaults to warn.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

} // namespace dbal

#define DBAL_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(::dbal::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define DBAL_LOG_ERROR(tag, fmt, ...) DBAL_LOG(::dbal::log_level::error, tag, fmt, ##__VA_ARGS__)
#define DBAL_LOG_WARN(tag, fmt, ...)  DBAL_LOG(::dbal::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define DBAL_LOG_INFO(tag, fmt, ...)  DBAL_LOG(::dbal::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define DBAL_LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define DBAL_LOG_DEBUG(tag, fmt, ...) DBAL_LOG(::dbal::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

// Every statement a driver sends, before it is sent.
#define DBAL_LOG_SQL(driver, sql) DBAL_LOG_DEBUG(driver, "sql: %s", (sql).c_str())

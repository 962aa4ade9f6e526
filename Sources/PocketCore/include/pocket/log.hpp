#pragma once

#include <atomic>
#include <cstdio>

namespace pocket {

// Ordered by verbosity; a message prints when its level <= g_log_level.
enum class log_level : int { off, error, warn, info, debug };

/// Process-wide threshold, defined in pocket.cpp. Defaults to off.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) { g_log_level.store(level, std::memory_order_relaxed); }
inline log_level get_log_level() { return g_log_level.load(std::memory_order_relaxed); }

inline bool log_enabled(log_level level) {
    return level != log_level::off && static_cast<int>(level) <= static_cast<int>(get_log_level());
}

inline char log_level_letter(log_level level) {
    switch (level) {
        case log_level::error: return 'E';
        case log_level::warn: return 'W';
        case log_level::info: return 'I';
        case log_level::debug: return 'D';
        case log_level::off: break;
    }
    return '?';
}

} // namespace pocket

// One line per message on stderr: "E [tag] message".
#define POCKET_LOG(level, tag, fmt, ...)                                                \
    do {                                                                                \
        if (pocket::log_enabled(level)) {                                               \
            std::fprintf(stderr, "%c [%s] " fmt "\n", pocket::log_level_letter(level), \
                         tag, ##__VA_ARGS__);                                           \
        }                                                                               \
    } while (0)

#define LOG_ERROR(tag, fmt, ...) POCKET_LOG(pocket::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...) POCKET_LOG(pocket::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...) POCKET_LOG(pocket::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) POCKET_LOG(pocket::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

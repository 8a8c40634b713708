#pragma once

#include <fmt/core.h>

#include <string_view>

namespace hatch::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

struct ev_log {
    log::level       level;
    std::string_view message;

    void print() const noexcept;
};

void log_print(level l, std::string_view s) noexcept;
void log_emit(ev_log) noexcept;

/**
 * @brief Install the "[level] message" pattern on every spdlog logger. Called before the first
 * message is printed; call it again after replacing the default logger.
 */
void init_logger() noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        auto message = fmt::format(fmt::runtime(s), args...);
        log_emit(ev_log{l, message});
    }
}

template <formattable... Args>
void trace(std::string_view s, const Args&... args) {
    log(level::trace, s, args...);
}

#define hatch_log(Level, str, ...)                                                                 \
    do {                                                                                           \
        if (int(hatch::log::level::Level) >= int(hatch::log::current_log_level)) {                 \
            ::hatch::log::log(::hatch::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                                                          \
    } while (0)

}  // namespace hatch::log

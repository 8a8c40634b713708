#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/spdlog.h>

void hatch::log::init_logger() noexcept {
    spdlog::set_pattern("[%^%-5l%$] %v");
    // Filtering happens against current_log_level before a message reaches spdlog
    spdlog::set_level(spdlog::level::trace);
}

void hatch::log::log_print(hatch::log::level l, std::string_view msg) noexcept {
    static const bool initialized = (init_logger(), true);
    (void)initialized;

    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
    }();

    auto logger = spdlog::default_logger_raw();
    logger->log(lvl, "{}", msg);
    // The isolated child leaves through _exit(), which skips stream teardown
    logger->flush();
}

void hatch::log::ev_log::print() const noexcept { log_print(level, message); }

void hatch::log::log_emit(ev_log ev) noexcept { ev.print(); }

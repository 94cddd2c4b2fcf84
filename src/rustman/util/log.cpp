#include "./log.hpp"

#include <neo/assert.hpp>
#include <neo/event.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void rustman::log::init_logger() noexcept {
    // stdout belongs to the project menu. Diagnostics go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("rustman"));
    spdlog::set_pattern("[%^%-5l%$] %v");
    // Filtering happens in rustman::log before a message reaches spdlog
    spdlog::set_level(spdlog::level::trace);
}

void rustman::log::log_print(rustman::log::level l, std::string_view msg) noexcept {
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

    spdlog::default_logger_raw()->log(lvl, "{}", msg);
}

void rustman::log::ev_log::print() const noexcept { log_print(level, message); }

void rustman::log::log_emit(ev_log ev) noexcept {
    if (!neo::get_event_subscriber<ev_log>()) {
        // Nobody is listening: Print it directly
        ev.print();
        return;
    }
    neo::emit(ev);
}

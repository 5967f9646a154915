#include "./log.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

using namespace tpipe;

namespace {

log_level initial_level() noexcept {
    auto ptr = std::getenv("TPIPE_LOG_LEVEL");
    if (!ptr) {
        return log_level::warn;
    }
    return parse_log_level(ptr).value_or(log_level::warn);
}

struct handler_slot {
    std::mutex  mutex;
    log_handler handler;
};

handler_slot& get_handler_slot() {
    static handler_slot slot;
    return slot;
}

void default_handler(log_level lvl, std::string_view message) {
    fmt::print(stderr, "[tpipe:{}] {}\n", log_level_name(lvl), message);
}

}  // namespace

std::string_view tpipe::log_level_name(log_level lvl) noexcept {
    switch (lvl) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        return "off";
    }
    return "unknown";
}

std::optional<log_level> tpipe::parse_log_level(std::string_view name) noexcept {
    for (auto lvl : {log_level::trace,
                     log_level::debug,
                     log_level::info,
                     log_level::warn,
                     log_level::error,
                     log_level::off}) {
        if (name == log_level_name(lvl)) {
            return lvl;
        }
    }
    return std::nullopt;
}

std::atomic<log_level>& log_detail::current_level() noexcept {
    static std::atomic<log_level> level{initial_level()};
    return level;
}

void tpipe::set_log_level(log_level lvl) noexcept {
    log_detail::current_level().store(lvl, std::memory_order_relaxed);
}

log_level tpipe::get_log_level() noexcept {
    return log_detail::current_level().load(std::memory_order_relaxed);
}

void tpipe::set_log_handler(log_handler h) {
    auto&           slot = get_handler_slot();
    std::lock_guard lk{slot.mutex};
    slot.handler = std::move(h);
}

void log_detail::emit(log_level lvl, std::string_view message) {
    auto&       slot = get_handler_slot();
    log_handler handler;
    {
        std::lock_guard lk{slot.mutex};
        handler = slot.handler;
    }
    // Called without the lock, so a handler may log or replace the handler itself
    if (handler) {
        handler(lvl, message);
    } else {
        default_handler(lvl, message);
    }
}

#pragma once

#include <fmt/format.h>

#include <neo/fwd.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string_view>

namespace tpipe {

/// Severity of a log message. Messages below the current level are discarded.
enum class log_level : unsigned char {
    trace,
    debug,
    info,
    warn,
    error,
    off,
};

/// A function that receives every log message that passes the level filter
using log_handler = std::function<void(log_level, std::string_view)>;

/// Get the lower-case name of a log level
[[nodiscard]] std::string_view log_level_name(log_level) noexcept;

/// Parse a log level name, as accepted in the TPIPE_LOG_LEVEL environment variable
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view name) noexcept;

/// Set the minimum level of messages that will be emitted
void set_log_level(log_level) noexcept;

/// Get the current minimum level
[[nodiscard]] log_level get_log_level() noexcept;

/**
 * @brief Replace the function that receives log messages.
 *
 * @param h The new handler. An empty function restores the default handler, which writes one line
 * per message to stderr.
 *
 * Handlers may be called from several threads at once. They are never called with a lock of this
 * library held, so a handler may log again or use any pipe.
 */
void set_log_handler(log_handler h);

namespace log_detail {

/// Current level. Initialized from TPIPE_LOG_LEVEL on first use.
std::atomic<log_level>& current_level() noexcept;

void emit(log_level lvl, std::string_view message);

}  // namespace log_detail

/// Returns true if a message at the given level would be emitted
[[nodiscard]] inline bool should_log(log_level lvl) noexcept {
    return lvl >= log_detail::current_level().load(std::memory_order_relaxed);
}

/**
 * @brief Format and emit a log message with {fmt} syntax
 */
template <typename... Args>
void log(log_level lvl, fmt::format_string<Args...> f, Args&&... args) {
    if (!should_log(lvl)) {
        return;
    }
    log_detail::emit(lvl, fmt::format(f, NEO_FWD(args)...));
}

template <typename... Args>
void log_trace(fmt::format_string<Args...> f, Args&&... args) {
    tpipe::log(log_level::trace, f, NEO_FWD(args)...);
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    tpipe::log(log_level::debug, f, NEO_FWD(args)...);
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    tpipe::log(log_level::info, f, NEO_FWD(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    tpipe::log(log_level::warn, f, NEO_FWD(args)...);
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    tpipe::log(log_level::error, f, NEO_FWD(args)...);
}

}  // namespace tpipe

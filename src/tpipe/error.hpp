#pragma once

#include <string_view>
#include <system_error>
#include <type_traits>

namespace tpipe {

/**
 * @brief Error conditions raised by pipe endpoints and the byte I/O helpers
 */
enum class pipe_errc {
    /// A write was attempted while no read endpoint is open
    broken_pipe = 1,
    /// An exact-length read asked for more bytes than can ever arrive
    unexpected_eof,
    /// A text read encountered bytes that are not valid UTF-8, or a value failed to parse
    invalid_data,
    /// The shared state was left half-modified by an exception and cannot be used again
    corrupted,
};

/// Get the error category for pipe_errc values
[[nodiscard]] const std::error_category& pipe_category() noexcept;

/// Create an error code in the pipe category
[[nodiscard]] std::error_code make_error_code(pipe_errc e) noexcept;

/**
 * @brief Base class of all exceptions thrown by tpipe I/O operations
 *
 * Derives from std::system_error. The code() is always in pipe_category(), and
 * compares equal to the matching std::errc condition where one exists.
 */
struct pipe_error : std::system_error {
    using system_error::system_error;
};

/// Thrown when writing to a pipe that has no open read endpoints
struct broken_pipe_error : pipe_error {
    using pipe_error::pipe_error;
};

/// Thrown when an exact read cannot be satisfied because the stream has ended
struct unexpected_eof_error : pipe_error {
    using pipe_error::pipe_error;
};

/// Thrown when bytes that must be text (or a parseable value) are malformed
struct invalid_data_error : pipe_error {
    using pipe_error::pipe_error;
};

/**
 * @brief Thrown on every access to a pipe whose shared state was corrupted.
 *
 * This is not recoverable. All endpoints of the pipe should be discarded.
 */
struct pipe_corrupted_error : pipe_error {
    using pipe_error::pipe_error;
};

/**
 * @brief Throw the exception type that corresponds to the given error code
 *
 * @param e The error condition
 * @param message A message to include in the exception
 */
[[noreturn]] void throw_for_pipe_errc(pipe_errc e, std::string_view message);

}  // namespace tpipe

template <>
struct std::is_error_code_enum<tpipe::pipe_errc> : std::true_type {};

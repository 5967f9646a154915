#pragma once

#include "./file_io.hpp"
#include "./io.hpp"

#include <charconv>
#include <concepts>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace tpipe {

/// Types that can be produced by parse_value()
template <typename T>
concept parseable_value = std::is_arithmetic_v<T> || std::same_as<T, std::string>;

namespace parse_detail {

/// Strip leading and trailing ASCII whitespace
std::string_view trim(std::string_view s) noexcept;

[[noreturn]] void throw_parse_failure(std::string_view text, std::string_view expected);

}  // namespace parse_detail

/**
 * @brief Parse a value from a string, ignoring surrounding whitespace
 *
 * Integers and floating point numbers are parsed with std::from_chars. `bool` accepts `true` and
 * `false`. A std::string is the trimmed text itself.
 *
 * @throws invalid_data_error if the whole trimmed string is not a valid `T`
 */
template <parseable_value T>
[[nodiscard]] T parse_value(std::string_view text) {
    auto s = parse_detail::trim(text);
    if constexpr (std::same_as<T, std::string>) {
        return std::string(s);
    } else if constexpr (std::same_as<T, bool>) {
        if (s == "true") {
            return true;
        } else if (s == "false") {
            return false;
        }
        parse_detail::throw_parse_failure(s, "a boolean");
    } else {
        T    value{};
        auto stop      = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(s.data(), stop, value);
        if (ec != std::errc{} || ptr != stop) {
            parse_detail::throw_parse_failure(
                s, std::is_floating_point_v<T> ? "a floating point number" : "an integer");
        }
        return value;
    }
}

/**
 * @brief Read one line from the source and parse it as a `T`
 *
 * @throws invalid_data_error if the line is not UTF-8 or does not parse
 */
template <parseable_value T>
[[nodiscard]] T read_value(byte_source& src) {
    return parse_value<T>(src.read_line());
}

/**
 * @brief Write a prompt message, then read a value in response
 *
 * @param out Where the prompt is written. It is flushed before reading.
 * @param in Where the response is read from
 * @param message The prompt text
 */
template <parseable_value T>
[[nodiscard]] T prompt(byte_sink& out, byte_source& in, std::string_view message) {
    out.write_all(message);
    out.flush();
    return read_value<T>(in);
}

/// Read one line from the standard input and parse it as a `T`
template <parseable_value T>
[[nodiscard]] T read_value_stdin() {
    return read_value<T>(stdin_source());
}

/// Write a prompt message to the standard output, then read a value from the standard input
template <parseable_value T>
[[nodiscard]] T prompt(std::string_view message) {
    return prompt<T>(stdout_sink(), stdin_source(), message);
}

}  // namespace tpipe

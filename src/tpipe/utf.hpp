#pragma once

#include <cstddef>
#include <stdexcept>
#include <string_view>

namespace tpipe {

struct utf_decode_error : std::runtime_error {
    using runtime_error::runtime_error;
};

namespace utf_detail {

struct ll_decode_res {
    char32_t    codepoint;
    std::size_t n_cus_taken;
};

ll_decode_res ll_decode(const char8_t* ptr, const char8_t* stop);
ll_decode_res ll_decode(const char* ptr, const char* stop);

}  // namespace utf_detail

/**
 * @brief Result of a single decode_one() operation
 */
struct decode_one_result {
    /// The decoded Unicode codepoint
    char32_t codepoint;
    /// The number of code units that encoded the codepoint
    std::size_t size;
};

/**
 * @brief Decode the first Unicode code point of some UTF-8 text
 *
 * @param text A non-empty string of UTF-8 code units
 *
 * @throws utf_decode_error if the leading code units are not valid UTF-8
 */
decode_one_result decode_one(std::string_view text);

/**
 * @brief Check that the entire given string is valid UTF-8
 *
 * @param text The bytes to check
 *
 * @throws utf_decode_error describing the first problem that was found, including its byte offset
 */
void validate_utf8(std::string_view text);

/// Determine whether the given string is entirely valid UTF-8
[[nodiscard]] bool is_valid_utf8(std::string_view text);

}  // namespace tpipe

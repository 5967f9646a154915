#include "./parse.hpp"

#include "./error.hpp"

#include <neo/ufmt.hpp>

using namespace tpipe;

namespace {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

}  // namespace

std::string_view parse_detail::trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

void parse_detail::throw_parse_failure(std::string_view text, std::string_view expected) {
    throw_for_pipe_errc(pipe_errc::invalid_data,
                        neo::ufmt("Cannot parse '{}' as {}", text, expected));
}

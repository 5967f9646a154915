#pragma once

#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>
#include <neo/trivial_range.hpp>

#include <ranges>
#include <string_view>

namespace tpipe {

using neo::const_buffer;
using neo::mutable_buffer;
using neo::mutable_trivial_range;
using neo::trivial_range;
using neo::trivial_type;

/// View the bytes of a buffer as characters
inline std::string_view as_string_view(const_buffer buf) noexcept {
    return std::string_view(reinterpret_cast<const char*>(buf.data()), buf.size());
}

}  // namespace tpipe

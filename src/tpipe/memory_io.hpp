#pragma once

#include "./io.hpp"

#include <string>
#include <utility>

namespace tpipe {

/**
 * @brief A byte_source that reads from a string held in memory.
 *
 * The source ends when the string is exhausted. Never blocks.
 */
class string_source : public byte_source {
    std::string _data;
    std::size_t _pos = 0;

    std::size_t do_read_some(mutable_buffer buf) override;
    void        do_read_exact(mutable_buffer buf) override;
    std::size_t do_read_until(char delim, std::string& out) override;
    std::size_t do_read_to_end(std::string& out) override;
    std::size_t do_read_to_string(std::string& out) override;

public:
    explicit string_source(std::string data) noexcept
        : _data(std::move(data)) {}

    /// The number of bytes that have not been read yet
    [[nodiscard]] std::size_t remaining() const noexcept { return _data.size() - _pos; }
};

/**
 * @brief A byte_sink that appends everything written into a string.
 */
class string_sink : public byte_sink {
    std::string _data;

    std::size_t do_write(const_buffer buf) override;
    void        do_write_all(const_buffer buf) override { do_write(buf); }

public:
    string_sink() = default;

    /// Get the data written so far
    [[nodiscard]] const std::string& str() const noexcept { return _data; }

    /// Take the data written so far, leaving the sink empty
    [[nodiscard]] std::string take() noexcept { return std::exchange(_data, std::string()); }
};

}  // namespace tpipe

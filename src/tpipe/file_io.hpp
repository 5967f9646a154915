#pragma once

#include "./io.hpp"

#include <cstdio>
#include <string>
#include <system_error>

namespace tpipe {

/**
 * @brief Exception thrown when the C library reports a failure on a stdio stream
 *
 * Derives from std::system_error
 */
struct stream_error : std::system_error {
    using system_error::system_error;
};

/**
 * @brief A byte_source that reads from a C stdio stream.
 *
 * This is a thin wrapper around std::fread() and friends. The stream is not owned and is never
 * closed. The source ends when the stream reports end-of-file.
 */
class file_source : public byte_source {
    std::FILE* _file;

    /// Blocks until the buffer is full or the stream ends
    std::size_t do_read_some(mutable_buffer buf) override;
    void        do_read_exact(mutable_buffer buf) override;
    std::size_t do_read_until(char delim, std::string& out) override;
    std::size_t do_read_to_end(std::string& out) override;

public:
    explicit file_source(std::FILE* f) noexcept
        : _file(f) {}

    /// The stream being read
    [[nodiscard]] std::FILE* file() const noexcept { return _file; }
};

/**
 * @brief A byte_sink that writes into a C stdio stream.
 *
 * The stream is not owned and is never closed. flush() calls std::fflush().
 */
class file_sink : public byte_sink {
    std::FILE* _file;

    std::size_t do_write(const_buffer buf) override;
    void        do_write_all(const_buffer buf) override;
    void        do_flush() override;

public:
    explicit file_sink(std::FILE* f) noexcept
        : _file(f) {}

    /// The stream being written
    [[nodiscard]] std::FILE* file() const noexcept { return _file; }
};

/// The process-wide source that reads the standard input
file_source& stdin_source() noexcept;

/// The process-wide sink that writes the standard output
file_sink& stdout_sink() noexcept;

}  // namespace tpipe

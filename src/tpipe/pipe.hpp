#pragma once

#include "./io.hpp"

#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <utility>

namespace tpipe {

class pipe_writer;

namespace detail {

struct pipe_state;

/**
 * @brief Run `fn` while holding the buffer lock, as if it were modifying the buffer.
 *
 * If `fn` throws, the pipe is marked corrupted exactly as a failed append or drain would leave it,
 * and the exception propagates. Used to test the corrupted state.
 */
void run_buffer_mutation(const pipe_writer& w, const std::function<void()>& fn);

}  // namespace detail

/// The largest number of bytes that a pipe buffer can address
inline constexpr std::size_t default_max_buffered
    = static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());

/**
 * @brief Options for creating a new pipe
 */
struct pipe_options {
    /**
     * @brief The most bytes the pipe will hold before writers must wait for readers.
     *
     * Must be non-zero.
     */
    std::size_t max_buffered = default_max_buffered;
};

struct pipe_pair;

/**
 * @brief Create a new in-process pipe
 *
 * @param opts Options for the new pipe
 * @return pipe_pair An open reader and writer that share the new pipe's buffer
 */
[[nodiscard]] pipe_pair create_pipe(pipe_options opts = {});

/**
 * @brief A pipe endpoint that is open for reading.
 *
 * Any number of threads may hold readers of the same pipe (see duplicate()). Each byte that is
 * written is delivered to exactly one reader, in the order it was written.
 *
 * While at least one writer of the pipe is open, every read operation blocks until it can be
 * satisfied. Once all writers are closed, reads drain whatever remains and then report the end of
 * the stream.
 */
class pipe_reader : public byte_source {
    std::shared_ptr<detail::pipe_state> _state;

    explicit pipe_reader(std::shared_ptr<detail::pipe_state> st) noexcept;
    friend pipe_pair create_pipe(pipe_options);

    detail::pipe_state& _checked_state() const;

    std::size_t do_read_some(mutable_buffer buf) override;
    void        do_read_exact(mutable_buffer buf) override;
    std::size_t do_read_until(char delim, std::string& out) override;
    std::size_t do_read_to_end(std::string& out) override;
    /// Validates what remains buffered before draining it, so invalid text stays in the pipe
    std::size_t do_read_to_string(std::string& out) override;

public:
    /// Construct a closed reader
    pipe_reader() = default;

    pipe_reader(pipe_reader&& o) noexcept
        : _state(std::move(o._state)) {}

    pipe_reader& operator=(pipe_reader&& o) noexcept {
        if (this != &o) {
            close();
            _state = std::move(o._state);
        }
        return *this;
    }

    /// Closes the reader
    ~pipe_reader() { close(); }

    /**
     * @brief Open another reader on the same pipe.
     *
     * @pre This reader is open
     */
    [[nodiscard]] pipe_reader duplicate() const;

    /// Determine whether this reader is open
    [[nodiscard]] bool is_open() const noexcept { return _state != nullptr; }

    /**
     * @brief Close the reader. Does nothing if it was already closed.
     *
     * When the last reader of a pipe is closed, all further writes will throw broken_pipe_error,
     * including writes that are currently blocked.
     */
    void close() noexcept;

    /// Determine whether any writer of this pipe is still open
    [[nodiscard]] bool has_writers() const noexcept;
};

/**
 * @brief A pipe endpoint that is open for writing.
 *
 * Writes never block unless the pipe is holding `max_buffered` bytes.
 */
class pipe_writer : public byte_sink {
    std::shared_ptr<detail::pipe_state> _state;

    explicit pipe_writer(std::shared_ptr<detail::pipe_state> st) noexcept;
    friend pipe_pair create_pipe(pipe_options);
    friend void detail::run_buffer_mutation(const pipe_writer&, const std::function<void()>&);

    detail::pipe_state& _checked_state() const;

    /// Appends as much as fits. Only waits if nothing fits.
    std::size_t do_write(const_buffer buf) override;
    /// Appends everything, waiting for room as often as needed
    void do_write_all(const_buffer buf) override;

public:
    /// Construct a closed writer
    pipe_writer() = default;

    pipe_writer(pipe_writer&& o) noexcept
        : _state(std::move(o._state)) {}

    pipe_writer& operator=(pipe_writer&& o) noexcept {
        if (this != &o) {
            close();
            _state = std::move(o._state);
        }
        return *this;
    }

    /// Closes the writer
    ~pipe_writer() { close(); }

    /**
     * @brief Open another writer on the same pipe.
     *
     * @pre This writer is open
     */
    [[nodiscard]] pipe_writer duplicate() const;

    /// Determine whether this writer is open
    [[nodiscard]] bool is_open() const noexcept { return _state != nullptr; }

    /**
     * @brief Close the writer. Does nothing if it was already closed.
     *
     * When the last writer of a pipe is closed, readers that are waiting for more data are woken
     * and observe the end of the stream.
     */
    void close() noexcept;

    /// Determine whether any reader of this pipe is still open
    [[nodiscard]] bool has_readers() const noexcept;
};

/**
 * @brief An aggregate of a pair of read and write endpoints of a new pipe
 */
struct pipe_pair {
    /// The read-end of the pipe
    pipe_reader reader;
    /// The write-end of the pipe
    pipe_writer writer;
};

}  // namespace tpipe

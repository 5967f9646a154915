#pragma once

#include "./trivial_range.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tpipe {

/**
 * @brief Abstract base class of objects that bytes can be read from.
 *
 * Every read operation may block until it can be satisfied. Failures are reported by throwing
 * a subclass of pipe_error.
 */
class byte_source {
public:
    virtual ~byte_source() = default;

private:
    /// Read at least one byte, unless the source has ended. Returns zero only at end-of-stream.
    virtual std::size_t do_read_some(mutable_buffer buf) = 0;
    /// Fill the whole buffer or throw unexpected_eof_error
    virtual void do_read_exact(mutable_buffer buf) = 0;
    /// Append through the first `delim` (inclusive), or everything up to end-of-stream
    virtual std::size_t do_read_until(char delim, std::string& out) = 0;
    /// Append everything up to end-of-stream
    virtual std::size_t do_read_to_end(std::string& out) = 0;
    /**
     * Append everything up to end-of-stream if it is valid UTF-8. The default reads to the end
     * and then validates, so the data is gone if validation fails. Sources that can leave the data
     * in place on failure should override this.
     */
    virtual std::size_t do_read_to_string(std::string& out);

protected:
    /// Throw invalid_data_error unless `text` is valid UTF-8. `what` prefixes the message.
    static void check_text(std::string_view text, const char* what);

public:
    /**
     * @brief Read some data/objects from the source
     *
     * @tparam T A trivially-copyable type to read
     * @param out The pointer-to-T instances where data will be placed
     * @param count The number of T objects that are pointed-to by `out`
     * @return std::size_t The number of T objects that were read
     */
    template <trivial_type T>
    std::size_t read_into(T* out, std::size_t count) {
        auto nbytes = do_read_some(neo::mutable_buffer(neo::byte_pointer(out), count * sizeof(T)));
        return nbytes / sizeof(T);
    }

    /**
     * @brief Read into the given contiguous range.
     *
     * @param out A contiguous range of trivially-copyable objects where the data will be stored
     * @return std::size_t The number of *objects* that were read
     *
     * @note Blocks until at least one byte is available. Returns zero only if the source has
     *       ended (or `out` is empty).
     */
    std::size_t read_into(mutable_trivial_range auto&& range) {
        return do_read_some(mutable_buffer(range)) / neo::data_type_size_v<decltype(range)>;
    }

    /**
     * @brief Read *at most* `count` bytes.
     *
     * @return std::string The bytes that were read. Empty only if the source has ended.
     */
    std::string read(std::size_t count);

    /**
     * @brief Fill the given range completely.
     *
     * @throws unexpected_eof_error if the source ends before enough data arrives
     */
    void read_exact_into(mutable_trivial_range auto&& range) {
        do_read_exact(mutable_buffer(range));
    }

    /**
     * @brief Read exactly `count` bytes.
     *
     * @throws unexpected_eof_error if the source ends before `count` bytes arrive
     */
    std::string read_exact(std::size_t count);

    /**
     * @brief Read through and including the first occurrence of `delim`.
     *
     * @param delim The delimiter byte
     * @param out A string to append the data to
     * @return std::size_t The number of bytes appended to `out`. If the source ends before a
     *         delimiter is found, the remaining bytes are appended without one.
     */
    std::size_t read_until(char delim, std::string& out) { return do_read_until(delim, out); }

    /// Read through and including the first occurrence of `delim` and return the data
    std::string read_until(char delim);

    /**
     * @brief Read one line of UTF-8 text, including its newline if one was present.
     *
     * @param out A string to append the line to. Unchanged if an exception is thrown.
     * @return std::size_t The number of bytes appended
     *
     * @throws invalid_data_error if the line is not valid UTF-8
     */
    std::size_t read_line(std::string& out);

    /// Read one line of UTF-8 text and return it
    std::string read_line();

    /**
     * @brief Read all data until the end-of-stream condition is hit
     *
     * @param out A string to append the data to
     * @return std::size_t The number of bytes appended
     */
    std::size_t read_to_end(std::string& out) { return do_read_to_end(out); }

    /**
     * @brief Read all data until the end-of-stream condition is hit
     *
     * @return std::string A string containing the contents that were read
     */
    std::string read();

    /**
     * @brief Read all remaining UTF-8 text.
     *
     * @param out A string to append the text to. Unchanged if an exception is thrown.
     * @return std::size_t The number of bytes appended
     *
     * @throws invalid_data_error if the data is not valid UTF-8. Sources that can (strings and
     *         pipes) leave the data unread in that case.
     */
    std::size_t read_to_string(std::string& out) { return do_read_to_string(out); }
};

/**
 * @brief Abstract base class of objects that bytes can be written into
 */
class byte_sink {
public:
    virtual ~byte_sink() = default;

private:
    /// Write some prefix of the buffer and return its size
    virtual std::size_t do_write(const_buffer buf) = 0;
    /// Write the whole buffer
    virtual void do_write_all(const_buffer buf) = 0;
    /// Push out any data held by the sink. Nothing to do by default.
    virtual void do_flush() {}

public:
    /**
     * @brief Write the given data
     *
     * @param data The data to be written
     * @returns The number of *objects* that were written. May be less than the size of `data`.
     */
    std::size_t write(trivial_range auto&& data) {
        auto nbytes = do_write(const_buffer(data));
        return nbytes / neo::data_type_size_v<decltype(data)>;
    }

    /**
     * @brief Write all of the given data, blocking as needed
     */
    void write_all(trivial_range auto&& data) { do_write_all(const_buffer(data)); }

    /// Flush the sink
    void flush() { do_flush(); }
};

}  // namespace tpipe

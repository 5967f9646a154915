#include "./file_io.hpp"

#include "./error.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>

using namespace tpipe;

namespace {

/// Throw stream_error if the last operation on `f` failed
void check_stream(std::FILE* f, const char* what) {
    if (std::ferror(f)) {
        auto ec = std::error_code{errno, std::system_category()};
        std::clearerr(f);
        throw stream_error(ec, what);
    }
}

}  // namespace

std::size_t file_source::do_read_some(mutable_buffer buf) {
    if (buf.size() == 0) {
        return 0;
    }
    errno      = 0;
    auto nread = std::fread(buf.data(), 1, buf.size(), _file);
    check_stream(_file, "Failed to read from stream");
    return nread;
}

void file_source::do_read_exact(mutable_buffer buf) {
    const auto want  = buf.size();
    auto       nread = do_read_some(buf);
    if (nread != want) {
        throw_for_pipe_errc(pipe_errc::unexpected_eof,
                            neo::ufmt("Exact read of {} bytes from a stream that ended after {}",
                                      want,
                                      nread));
    }
}

std::size_t file_source::do_read_until(char delim, std::string& out) {
    std::string got;
    errno = 0;
    for (int c = std::getc(_file); c != EOF; c = std::getc(_file)) {
        got.push_back(static_cast<char>(c));
        if (got.back() == delim) {
            break;
        }
    }
    check_stream(_file, "Failed to read from stream");
    out.append(got);
    return got.size();
}

std::size_t file_source::do_read_to_end(std::string& out) {
    std::size_t total = 0;
    char        chunk[4096];
    while (auto n = do_read_some(mutable_buffer(neo::byte_pointer(chunk), sizeof chunk))) {
        out.append(chunk, n);
        total += n;
    }
    return total;
}

std::size_t file_sink::do_write(const_buffer buf) {
    errno               = 0;
    const auto nwritten = std::fwrite(buf.data(), 1, buf.size(), _file);
    check_stream(_file, "Failed to write to stream");
    return nwritten;
}

void file_sink::do_write_all(const_buffer buf) {
    const auto nwritten = do_write(buf);
    neo_assert(ensures,
               nwritten == buf.size(),
               "Not all of the data was written to the stream",
               nwritten,
               buf.size());
}

void file_sink::do_flush() {
    if (std::fflush(_file) != 0) {
        auto ec = std::error_code{errno, std::system_category()};
        std::clearerr(_file);
        throw stream_error(ec, "Failed to flush stream");
    }
}

file_source& tpipe::stdin_source() noexcept {
    static file_source src{stdin};
    return src;
}

file_sink& tpipe::stdout_sink() noexcept {
    static file_sink sink{stdout};
    return sink;
}

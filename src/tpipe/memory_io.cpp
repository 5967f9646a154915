#include "./memory_io.hpp"

#include "./error.hpp"

#include <neo/ufmt.hpp>

#include <algorithm>
#include <cstring>
#include <string_view>

using namespace tpipe;

std::size_t string_source::do_read_some(mutable_buffer buf) {
    auto n = std::min(buf.size(), remaining());
    if (n == 0) {
        return 0;
    }
    std::memcpy(buf.data(), _data.data() + _pos, n);
    _pos += n;
    return n;
}

void string_source::do_read_exact(mutable_buffer buf) {
    if (buf.size() > remaining()) {
        throw_for_pipe_errc(pipe_errc::unexpected_eof,
                            neo::ufmt("Exact read of {} bytes from a string with only {} remaining",
                                      buf.size(),
                                      remaining()));
    }
    do_read_some(buf);
}

std::size_t string_source::do_read_until(char delim, std::string& out) {
    auto found = _data.find(delim, _pos);
    auto stop  = found == std::string::npos ? _data.size() : found + 1;
    auto n     = stop - _pos;
    out.append(_data, _pos, n);
    _pos = stop;
    return n;
}

std::size_t string_source::do_read_to_end(std::string& out) {
    auto n = remaining();
    out.append(_data, _pos, n);
    _pos = _data.size();
    return n;
}

std::size_t string_source::do_read_to_string(std::string& out) {
    auto rest = std::string_view(_data).substr(_pos);
    check_text(rest, "String content is not valid UTF-8");
    out.append(rest);
    _pos = _data.size();
    return rest.size();
}

std::size_t string_sink::do_write(const_buffer buf) {
    _data.append(as_string_view(buf));
    return buf.size();
}

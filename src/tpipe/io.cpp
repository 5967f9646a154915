#include "./io.hpp"

#include "./error.hpp"
#include "./utf.hpp"

#include <neo/ufmt.hpp>

using namespace tpipe;

void byte_source::check_text(std::string_view text, const char* what) {
    try {
        validate_utf8(text);
    } catch (const utf_decode_error& e) {
        throw invalid_data_error(make_error_code(pipe_errc::invalid_data),
                                 neo::ufmt("{}: {}", what, e.what()));
    }
}

std::string byte_source::read(std::size_t count) {
    std::string ret;
    ret.resize(count);
    auto nread = read_into(ret);
    ret.resize(nread);
    return ret;
}

std::string byte_source::read_exact(std::size_t count) {
    std::string ret;
    ret.resize(count);
    read_exact_into(ret);
    return ret;
}

std::string byte_source::read_until(char delim) {
    std::string ret;
    read_until(delim, ret);
    return ret;
}

std::size_t byte_source::read_line(std::string& out) {
    std::string line;
    auto        n = read_until('\n', line);
    check_text(line, "Line read from stream is not valid UTF-8");
    out.append(line);
    return n;
}

std::string byte_source::read_line() {
    std::string ret;
    read_line(ret);
    return ret;
}

std::string byte_source::read() {
    std::string ret;
    read_to_end(ret);
    return ret;
}

std::size_t byte_source::do_read_to_string(std::string& out) {
    std::string text;
    auto        n = read_to_end(text);
    check_text(text, "Stream content is not valid UTF-8");
    out.append(text);
    return n;
}

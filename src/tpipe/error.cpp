#include "./error.hpp"

#include <string>

using namespace tpipe;

namespace {

class pipe_category_impl : public std::error_category {
public:
    const char* name() const noexcept override { return "tpipe"; }

    std::string message(int ev) const override {
        switch (static_cast<pipe_errc>(ev)) {
        case pipe_errc::broken_pipe:
            return "Pipe has no open read endpoints";
        case pipe_errc::unexpected_eof:
            return "Pipe has no open write endpoints and too few bytes remain";
        case pipe_errc::invalid_data:
            return "Invalid data in stream";
        case pipe_errc::corrupted:
            return "Pipe state is corrupted";
        }
        return "Unknown tpipe error";
    }

    std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<pipe_errc>(ev)) {
        case pipe_errc::broken_pipe:
            return std::errc::broken_pipe;
        case pipe_errc::invalid_data:
            return std::errc::illegal_byte_sequence;
        case pipe_errc::corrupted:
            return std::errc::state_not_recoverable;
        case pipe_errc::unexpected_eof:
            break;
        }
        return std::error_condition(ev, *this);
    }
};

}  // namespace

const std::error_category& tpipe::pipe_category() noexcept {
    static const pipe_category_impl inst;
    return inst;
}

std::error_code tpipe::make_error_code(pipe_errc e) noexcept {
    return std::error_code(static_cast<int>(e), pipe_category());
}

void tpipe::throw_for_pipe_errc(pipe_errc e, std::string_view message) {
    auto ec  = make_error_code(e);
    auto msg = std::string(message);
    switch (e) {
    case pipe_errc::broken_pipe:
        throw broken_pipe_error(ec, msg);
    case pipe_errc::unexpected_eof:
        throw unexpected_eof_error(ec, msg);
    case pipe_errc::invalid_data:
        throw invalid_data_error(ec, msg);
    case pipe_errc::corrupted:
        throw pipe_corrupted_error(ec, msg);
    }
    throw pipe_error(ec, msg);
}

#include "./utf.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>
#include <neo/utf8.hpp>

using namespace tpipe;

utf_detail::ll_decode_res utf_detail::ll_decode(const char8_t* in, const char8_t* stop) {
    neo_assert(expects, in != stop, "Empty range of UTF-8 codepoints given to decode");
    auto cp   = neo::next_utf8_codepoint(in, stop);
    using err = neo::utf8_errc;
    switch (cp.error()) {
    case err::none:
        break;
    case err::invalid_continuation_byte:
        throw utf_decode_error("Invalid continuation byte in UTF-8 stream");
    case err::invalid_start_byte:
        throw utf_decode_error("Invalid codepoint start byte in UTF-8 stream");
    case err::need_more:
        throw utf_decode_error("Truncated UTF-8 encoded text");
    }
    return {cp.codepoint, cp.size};
}

utf_detail::ll_decode_res utf_detail::ll_decode(const char* ptr, const char* stop) {
    return utf_detail::ll_decode(reinterpret_cast<const char8_t*>(ptr),
                                 reinterpret_cast<const char8_t*>(stop));
}

decode_one_result tpipe::decode_one(std::string_view text) {
    auto [cp, dist] = utf_detail::ll_decode(text.data(), text.data() + text.size());
    return decode_one_result{cp, dist};
}

void tpipe::validate_utf8(std::string_view text) {
    std::size_t offset = 0;
    while (offset < text.size()) {
        // Plain ASCII never needs the full decoder
        if (static_cast<unsigned char>(text[offset]) < 0x80) {
            ++offset;
            continue;
        }
        try {
            offset += decode_one(text.substr(offset)).size;
        } catch (const utf_decode_error& e) {
            throw utf_decode_error(neo::ufmt("{} (at byte offset {})", e.what(), offset));
        }
    }
}

bool tpipe::is_valid_utf8(std::string_view text) {
    try {
        validate_utf8(text);
        return true;
    } catch (const utf_decode_error&) {
        return false;
    }
}

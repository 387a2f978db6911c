#include "tweetprep/string.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace tweetprep {

namespace {

    [[nodiscard]] auto bytes(std::string_view str) -> std::uint8_t const* {
        return reinterpret_cast<std::uint8_t const*>(str.data());
    }

    [[nodiscard]] auto is_space(UChar32 code_point) -> bool {
        return code_point >= 0 && u_isspace(code_point) != 0;
    }

    /// Decodes the code point at `pos` and moves `pos` past it.
    [[nodiscard]] auto next_code_point(std::string_view str, std::size_t& pos) -> UChar32 {
        auto offset = static_cast<std::int32_t>(pos);
        UChar32 code_point;
        U8_NEXT(bytes(str), offset, static_cast<std::int32_t>(str.size()), code_point);
        pos = static_cast<std::size_t>(offset);
        return code_point;
    }

}  // namespace

auto whitespace_prefix(std::string_view str) -> std::size_t {
    std::size_t pos = 0;
    while (pos < str.size()) {
        auto next = pos;
        if (!is_space(next_code_point(str, next))) {
            break;
        }
        pos = next;
    }
    return pos;
}

auto find_whitespace(std::string_view str) -> std::size_t {
    std::size_t pos = 0;
    while (pos < str.size()) {
        auto next = pos;
        if (is_space(next_code_point(str, next))) {
            return pos;
        }
        pos = next;
    }
    return str.size();
}

auto trim(std::string_view str) -> std::string_view {
    str.remove_prefix(whitespace_prefix(str));
    auto end = static_cast<std::int32_t>(str.size());
    while (end > 0) {
        auto prev = end;
        UChar32 code_point;
        U8_PREV(bytes(str), 0, prev, code_point);
        if (!is_space(code_point)) {
            break;
        }
        end = prev;
    }
    return str.substr(0, static_cast<std::size_t>(end));
}

auto is_blank(std::string_view str) -> bool {
    return whitespace_prefix(str) == str.size();
}

auto is_punctuation(char symbol) -> bool {
    auto ch = static_cast<unsigned char>(symbol);
    return ch < 128 && std::ispunct(ch) != 0;
}

auto is_digit(char symbol) -> bool {
    return symbol >= '0' && symbol <= '9';
}

auto is_alpha(char symbol) -> bool {
    return (symbol >= 'a' && symbol <= 'z') || (symbol >= 'A' && symbol <= 'Z');
}

auto utf8_length(std::string_view str) -> std::size_t {
    return std::count_if(str.begin(), str.end(), [](char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U;
    });
}

}  // namespace tweetprep

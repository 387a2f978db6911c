#pragma once

#include <cstddef>
#include <string_view>

namespace tweetprep {

/**
 * Number of bytes of the run of whitespace at the start of a UTF-8 string.
 *
 * Whitespace is any code point ICU's `u_isspace` accepts: ASCII whitespace, the separators
 * (e.g., no-break space U+00A0, em space U+2003, ideographic space U+3000), U+0085, and the
 * information separators U+001C-U+001F. Malformed sequences are never whitespace.
 */
[[nodiscard]] auto whitespace_prefix(std::string_view str) -> std::size_t;

/** Byte offset of the first whitespace code point, or `str.size()` if there is none. */
[[nodiscard]] auto find_whitespace(std::string_view str) -> std::size_t;

/** Strips leading and trailing whitespace; see `whitespace_prefix`. */
[[nodiscard]] auto trim(std::string_view str) -> std::string_view;

/** True if the string is empty or whitespace only. */
[[nodiscard]] auto is_blank(std::string_view str) -> bool;

/** One of the 32 ASCII punctuation characters, e.g., `!`, `#`, `@`, or `~`. */
[[nodiscard]] auto is_punctuation(char symbol) -> bool;

[[nodiscard]] auto is_digit(char symbol) -> bool;

/** ASCII letter `a-z` or `A-Z`. */
[[nodiscard]] auto is_alpha(char symbol) -> bool;

/**
 * Number of code points in a UTF-8 encoded string.
 *
 * Continuation bytes are not counted; the input is not validated.
 */
[[nodiscard]] auto utf8_length(std::string_view str) -> std::size_t;

}  // namespace tweetprep

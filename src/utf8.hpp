#pragma once
/*
 * utf8
 *
 * Purpose: column arithmetic for UTF-8 text (box drawing, CJK) in a fixed-width terminal.
 * Note: width follows East Asian Width (W/F = 2 columns, everything else 1).
 */
#include <string>
#include <string_view>
#include <cstddef>

namespace utf8 {

// Decodes the code point starting at s[pos]; len receives its byte count.
// Malformed sequences decode as U+FFFD and consume one byte.
char32_t decode(std::string_view s, size_t pos, size_t& len);

int char_width(char32_t cp);
int display_width(std::string_view s);

// Keeps the longest prefix that fits max_width columns. With add_indicator a
// cut line ends in the truncation marker, which takes the last column.
std::string truncate_to_width(std::string_view s, int max_width, bool add_indicator = false);

// Exactly `width` columns: truncated with marker when wider, space padded when narrower.
std::string fit_to_width(std::string_view s, int width);

inline constexpr std::string_view kEllipsis = "\xE2\x80\xA6";

} // namespace utf8

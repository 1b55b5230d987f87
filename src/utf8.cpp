#include "utf8.hpp"

namespace utf8 {

static constexpr unsigned char mask_cont = 0b1100'0000;
static constexpr unsigned char test_cont = 0b1000'0000;

char32_t decode(std::string_view s, size_t pos, size_t& len) {
  unsigned char c = static_cast<unsigned char>(s[pos]);
  len = 1;
  if (c < 0x80) return c;
  int extra = 0;
  char32_t cp = 0;
  if ((c & 0b1110'0000) == 0b1100'0000) { extra = 1; cp = c & 0x1F; }
  else if ((c & 0b1111'0000) == 0b1110'0000) { extra = 2; cp = c & 0x0F; }
  else if ((c & 0b1111'1000) == 0b1111'0000) { extra = 3; cp = c & 0x07; }
  else return U'\uFFFD';
  if (pos + extra >= s.size()) return U'\uFFFD';
  for (int i = 1; i <= extra; ++i) {
    unsigned char t = static_cast<unsigned char>(s[pos + i]);
    if ((t & mask_cont) != test_cont) return U'\uFFFD';
    cp = (cp << 6) | (t & 0x3F);
  }
  len = static_cast<size_t>(extra) + 1;
  return cp;
}

int char_width(char32_t cp) {
  struct Range { char32_t lo, hi; };
  static constexpr Range wide[] = {
    {0x1100, 0x115F}, {0x2E80, 0x303E}, {0x3041, 0x33FF}, {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF}, {0xA000, 0xA4CF}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF},
    {0xFE30, 0xFE4F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
  };
  if (cp < 0x1100) return 1;
  for (const auto& r : wide) {
    if (cp < r.lo) break;
    if (cp <= r.hi) return 2;
  }
  return 1;
}

int display_width(std::string_view s) {
  int w = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t len = 1;
    w += char_width(decode(s, i, len));
    i += len;
  }
  return w;
}

std::string truncate_to_width(std::string_view s, int max_width, bool add_indicator) {
  if (max_width <= 0) return std::string();
  if (display_width(s) <= max_width) return std::string(s);
  int budget = add_indicator ? max_width - 1 : max_width;
  int used = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t len = 1;
    int cw = char_width(decode(s, i, len));
    if (used + cw > budget) break;
    used += cw;
    i += len;
  }
  std::string out(s.substr(0, i));
  if (add_indicator) out += kEllipsis;
  return out;
}

std::string fit_to_width(std::string_view s, int width) {
  if (width <= 0) return std::string();
  std::string out = truncate_to_width(s, width, true);
  int w = display_width(out);
  if (w < width) out.append(static_cast<size_t>(width - w), ' ');
  return out;
}

} // namespace utf8

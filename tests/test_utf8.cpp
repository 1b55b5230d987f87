#include "utf8.hpp"
#include <cassert>
#include <string>

int main() {
  assert(utf8::display_width("abc") == 3);
  assert(utf8::display_width("┌──┐") == 4);
  assert(utf8::display_width("日本") == 4);
  assert(utf8::display_width("") == 0);

  size_t len = 0;
  assert(utf8::decode("\xFF" "a", 0, len) == U'\uFFFD');
  assert(len == 1);
  assert(utf8::decode("│", 0, len) == U'\u2502');
  assert(len == 3);
  // cut short multibyte sequence
  assert(utf8::decode("\xE2\x94", 0, len) == U'\uFFFD');
  assert(len == 1);

  assert(utf8::truncate_to_width("abcdef", 4) == "abcd");
  assert(utf8::truncate_to_width("abc", 4) == "abc");
  assert(utf8::truncate_to_width("日本語", 5) == "日本");
  assert(utf8::truncate_to_width("abcdef", 4, true) == "abc…");
  assert(utf8::truncate_to_width("abc", 0) == "");

  assert(utf8::fit_to_width("ab", 4) == "ab  ");
  assert(utf8::fit_to_width("abcdef", 4) == "abc…");
  assert(utf8::fit_to_width("│ x │", 5) == "│ x │");
  std::string cjk = utf8::fit_to_width("日本語", 4);
  assert(utf8::display_width(cjk) == 4);
  assert(cjk == "日… ");
  assert(utf8::fit_to_width("abc", 0).empty());
  return 0;
}

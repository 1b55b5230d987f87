#include "slide_parser.hpp"
#include <cassert>
#include <string>

static const char* kFull =
  "# 03. Architecture\n"
  "\n"
  "Some commentary the presenter ignores.\n"
  "\n"
  "```\n"
  "┌──────────┐\n"
  "│ a    b   │\n"
  "└──────────┘\n"
  "```\n"
  "\n"
  "## Speaker Notes\n"
  "\n"
  "Remember to mention the cache.\n"
  "  indented detail\n"
  "\n"
  "\n";

static void test_full_document() {
  Slide s; std::string msg;
  assert(parse_slide(kFull, 7, s, msg));
  assert(s.index == 7);
  assert(s.title == "03. Architecture");
  assert(s.declared_number && *s.declared_number == 3);
  assert(s.body_lines.size() == 3);
  assert(s.body_lines[0] == "┌──────────┐");
  assert(s.body_lines[1] == "│ a    b   │");
  assert(s.notes == "Remember to mention the cache.\n  indented detail");
}

static void test_without_notes() {
  std::string doc = "# Intro\n```\n  one  \ntwo\n   \n```\n";
  Slide s; std::string msg;
  assert(parse_slide(doc, 1, s, msg));
  assert(s.notes.empty());
  assert(!s.has_notes());
  assert(s.body_lines.size() == 3);
  assert(s.body_lines[0] == "  one  ");
  assert(s.body_lines[2] == "   ");
  assert(!s.declared_number);
}

static void test_title_only() {
  Slide s; std::string msg;
  assert(parse_slide("# Section two\n\nplain text, no fence\n", 2, s, msg));
  assert(s.title == "Section two");
  assert(s.body_lines.empty());
}

static void test_missing_title() {
  Slide s; std::string msg;
  assert(!parse_slide("Just text\n```\nx\n```\n", 1, s, msg));
  assert(!msg.empty());
  // a heading inside the fence is content, not a title
  msg.clear();
  assert(!parse_slide("```\n# not a title\n```\n", 1, s, msg));
  assert(!msg.empty());
  // "## Sub" is not a title heading
  assert(!parse_slide("## Sub heading\n", 1, s, msg));
  // a title after the notes heading does not count
  assert(!parse_slide("## Speaker Notes\n# Late title\n", 1, s, msg));
}

static void test_fence_rules() {
  Slide s; std::string msg;
  assert(parse_slide("# T\n```\n## Speaker Notes\n```\n", 1, s, msg));
  assert(s.body_lines.size() == 1);
  assert(s.body_lines[0] == "## Speaker Notes");
  assert(s.notes.empty());

  assert(parse_slide("# T\n```text\nfirst\n```\n```\nsecond\n```\n", 1, s, msg));
  assert(s.body_lines.size() == 1);
  assert(s.body_lines[0] == "first");

  assert(parse_slide("# T\n~~~\n``` inside\n~~~\n", 1, s, msg));
  assert(s.body_lines.size() == 1);
  assert(s.body_lines[0] == "``` inside");

  // unterminated fence runs to the end of the document
  assert(parse_slide("# T\n```\na\nb\n", 1, s, msg));
  assert(s.body_lines.size() == 2);
}

static void test_crlf_and_case() {
  Slide s; std::string msg;
  assert(parse_slide("# T\r\n```\r\n  x  \r\n```\r\n### speaker notes\r\nsay hi\r\n", 4, s, msg));
  assert(s.body_lines.size() == 1);
  assert(s.body_lines[0] == "  x  ");
  assert(s.notes == "say hi");
}

static void test_heading_number() {
  int n = 0;
  assert(heading_number("03. Intro", n) && n == 3);
  assert(heading_number("Slide 4: Memory", n) && n == 4);
  assert(heading_number("12 - Scope", n) && n == 12);
  assert(heading_number("7", n) && n == 7);
  assert(!heading_number("2024 Roadmap", n));
  assert(!heading_number("Intro", n));
}

int main() {
  test_full_document();
  test_without_notes();
  test_title_only();
  test_missing_title();
  test_fence_rules();
  test_crlf_and_case();
  test_heading_number();
  return 0;
}

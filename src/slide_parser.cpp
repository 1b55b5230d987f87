#include "slide_parser.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <algorithm>
#include <utility>

static inline bool is_space(unsigned char c) { return std::isspace(c) != 0; }

static std::string_view trim(std::string_view s) {
  size_t i = 0; while (i < s.size() && is_space(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && is_space(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

static bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

// Returns the fence character ('`' or '~') when the trimmed line opens a fence.
static char fence_char(std::string_view trimmed) {
  if (trimmed.size() < 3) return 0;
  char c = trimmed[0];
  if (c != '`' && c != '~') return 0;
  if (trimmed[1] != c || trimmed[2] != c) return 0;
  return c;
}

static bool closes_fence(std::string_view trimmed, char c) {
  if (fence_char(trimmed) != c) return false;
  return std::all_of(trimmed.begin(), trimmed.end(), [c](char ch) { return ch == c; });
}

// "# Title" -> "Title"; "## ..." is not a title heading.
static bool title_heading(std::string_view line, std::string_view& text) {
  if (line.size() < 2 || line[0] != '#' || line[1] != ' ') return false;
  text = trim(line.substr(2));
  return true;
}

static bool notes_heading(std::string_view trimmed) {
  size_t hashes = 0;
  while (hashes < trimmed.size() && trimmed[hashes] == '#') hashes++;
  if (hashes < 2 || hashes >= trimmed.size() || trimmed[hashes] != ' ') return false;
  return iequals(trim(trimmed.substr(hashes)), "speaker notes");
}

bool heading_number(std::string_view heading, int& number) {
  std::string_view s = trim(heading);
  bool prefixed = false;
  if (s.size() > 6 && iequals(s.substr(0, 6), "slide ")) {
    s = trim(s.substr(6));
    prefixed = true;
  }
  size_t i = 0;
  long value = 0;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])) && i < 6) {
    value = value * 10 + (s[i] - '0');
    i++;
  }
  if (i == 0) return false;
  if (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  size_t j = i;
  while (j < s.size() && s[j] == ' ') j++;
  bool separated = j == s.size() || s[j] == '.' || s[j] == ':' || s[j] == ')' || s[j] == '-';
  if (!separated && !prefixed) return false;
  number = static_cast<int>(value);
  return true;
}

bool parse_slide(std::string_view text, int expected_index, Slide& out, std::string& msg) {
  std::vector<std::string> lines = split_lines(text);
  Slide s;
  s.index = expected_index;
  bool have_title = false;
  bool in_fence = false;
  bool collecting = false;
  bool have_block = false;
  char fence = 0;
  size_t notes_begin = lines.size();

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& line = lines[i];
    std::string_view t = trim(line);
    if (in_fence) {
      if (closes_fence(t, fence)) { in_fence = false; collecting = false; continue; }
      if (collecting) s.body_lines.push_back(line);
      continue;
    }
    if (char c = fence_char(t)) {
      in_fence = true;
      fence = c;
      collecting = !have_block;
      have_block = true;
      continue;
    }
    if (notes_heading(t)) { notes_begin = i + 1; break; }
    std::string_view heading;
    if (!have_title && title_heading(line, heading) && !heading.empty()) {
      s.title = std::string(heading);
      have_title = true;
      int n = 0;
      if (heading_number(heading, n)) s.declared_number = n;
    }
  }

  if (!have_title) {
    msg = "missing title heading ('# <title>')";
    return false;
  }

  if (notes_begin < lines.size()) {
    auto blank = [](const std::string& l) { return trim(l).empty(); };
    size_t b = notes_begin, e = lines.size();
    while (b < e && blank(lines[b])) b++;
    while (e > b && blank(lines[e - 1])) e--;
    for (size_t i = b; i < e; ++i) {
      if (i > b) s.notes += '\n';
      s.notes += lines[i];
    }
  }

  out = std::move(s);
  return true;
}

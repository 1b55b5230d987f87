#pragma once
/*
 * Slide
 *
 * Purpose: one parsed presentation unit (title, literal body rows, speaker notes).
 * Note: body_lines are pre-formatted terminal rows; never reflowed or mutated after parse.
 */
#include <optional>
#include <string>
#include <vector>

struct Slide {
  int index = 0;                       // 1-based position in the deck
  std::string title;
  std::vector<std::string> body_lines;
  std::string notes;                   // empty when the document has no notes section
  std::optional<int> declared_number;  // number written in the heading, informational only
  std::string source_name;

  int body_line_count() const { return static_cast<int>(body_lines.size()); }
  bool has_notes() const { return !notes.empty(); }
};

#pragma once
/*
 * SlideParser
 *
 * Purpose: turn one slide document into a Slide with a single forward scan.
 * Regions: "# " title heading, first fenced block (``` or ~~~), trailing "## Speaker Notes".
 * Note: text outside those regions is commentary and ignored.
 */
#include <string>
#include <string_view>
#include <vector>
#include "slide.hpp"

// Per-document failure, reported by deck construction.
struct ParseError {
  std::string document;
  int position = 0;  // 1-based position in the load ordering
  std::string message;
};

// expected_index is authoritative for Slide::index; a number in the heading is
// only recorded as declared_number. Returns false with msg when no title heading exists.
bool parse_slide(std::string_view text, int expected_index, Slide& out, std::string& msg);

// "03. Intro" -> 3, "Slide 4: Memory" -> 4, "3 - Scope" -> 3, "2024 Roadmap" -> none.
bool heading_number(std::string_view heading, int& number);

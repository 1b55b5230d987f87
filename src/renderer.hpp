#pragma once
/*
 * Renderer
 *
 * Purpose: lay out the current view (slide body, notes, index, help) as a Frame.
 * Constraint: render() is pure; identical inputs give identical frames.
 * Layout: row 0 header, last row footer; body rows between. When the body
 * overflows, the first and last body rows carry the more-above/more-below markers;
 * otherwise it may be centred in the body rows.
 * Dependency: present() draws a Frame via ITerminal to allow backend replacement.
 */
#include <string>
#include <vector>
#include "deck.hpp"
#include "types.hpp"
#include "iterminal.hpp"

enum class LineStyle { Plain, Title, Status, Selected, Dim, Marker };

struct FrameLine {
  std::string text;  // exactly the viewport width in columns
  LineStyle style = LineStyle::Plain;
};

using Frame = std::vector<FrameLine>;

struct RenderOptions {
  bool center = true;  // center a body block that fits, both ways
  bool hints = true;   // key hints in the footer
};

struct RenderInfo {
  const Deck* deck = nullptr;
  ViewState view{};
  int width = 0;
  int height = 0;
  std::string message;  // transient status text or prompt
  RenderOptions opts{};
};

struct BodyLayout {
  int rows = 0;        // rows between header and footer
  int window = 0;      // rows showing body lines
  bool overflow = false;
  bool markers = false;
  int max_scroll = 0;
};

inline constexpr int kChromeRows = 2;

BodyLayout body_layout(int body_line_count, int height);
int overlay_window(int height);
int overlay_line_count(const Deck& deck, const ViewState& view, int width);
int overlay_max_scroll(const Deck& deck, const ViewState& view, int width, int height);

// Greedy word wrap of prose (speaker notes); blank input lines are kept.
std::vector<std::string> wrap_text(const std::string& text, int width);

const std::vector<std::string>& help_lines();

class Renderer {
public:
  Frame render(const RenderInfo& info) const;
  void present(ITerminal& term, const Frame& frame) const;
};

#include "renderer.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include "utf8.hpp"
#include "file_reader.hpp"

const char* mode_name(ViewMode m) {
  switch (m) {
    case ViewMode::Normal: return "NORMAL";
    case ViewMode::Notes: return "NOTES";
    case ViewMode::Index: return "INDEX";
    case ViewMode::Help: return "HELP";
  }
  return "NORMAL";
}

static FrameLine make_line(std::string_view s, int width, LineStyle st = LineStyle::Plain) {
  return FrameLine{utf8::fit_to_width(s, width), st};
}

static FrameLine blank_line(int width) { return FrameLine{std::string(static_cast<size_t>(std::max(0, width)), ' '), LineStyle::Plain}; }

static std::string centered(std::string_view s, int width) {
  int pad = std::max(0, (width - utf8::display_width(s)) / 2);
  return std::string(static_cast<size_t>(pad), ' ') + std::string(s);
}

static std::string position_text(const Deck& deck, const ViewState& v) {
  if (deck.empty() || v.current_index < 0) return "[0/0]";
  return "[" + std::to_string(v.current_index + 1) + "/" + std::to_string(deck.count()) + "]";
}

BodyLayout body_layout(int body_line_count, int height) {
  BodyLayout l;
  l.rows = std::max(0, height - kChromeRows);
  l.overflow = body_line_count > l.rows;
  l.markers = l.overflow && l.rows >= 3;
  l.window = l.markers ? l.rows - 2 : std::min(body_line_count, l.rows);
  l.max_scroll = (l.overflow && l.window > 0) ? body_line_count - l.window : 0;
  return l;
}

int overlay_window(int height) { return std::max(0, height - kChromeRows); }

std::vector<std::string> wrap_text(const std::string& text, int width) {
  std::vector<std::string> out;
  if (width < 1) width = 1;
  for (const std::string& para : split_lines(text)) {
    size_t ind = 0;
    while (ind < para.size() && (para[ind] == ' ' || para[ind] == '\t')) ind++;
    if (ind == para.size()) { out.emplace_back(); continue; }
    std::string indent(std::min<size_t>(ind, static_cast<size_t>(width / 2)), ' ');
    std::string cur = indent;
    int cur_w = static_cast<int>(indent.size());
    bool have_word = false;
    size_t p = ind;
    while (p < para.size()) {
      while (p < para.size() && std::isspace(static_cast<unsigned char>(para[p]))) p++;
      if (p >= para.size()) break;
      size_t q = p;
      while (q < para.size() && !std::isspace(static_cast<unsigned char>(para[q]))) q++;
      std::string_view word(para.data() + p, q - p);
      int ww = utf8::display_width(word);
      if (have_word && cur_w + 1 + ww > width) {
        out.push_back(cur);
        cur = indent;
        cur_w = static_cast<int>(indent.size());
        have_word = false;
      }
      if (have_word) { cur += ' '; cur_w++; }
      cur += word;
      cur_w += ww;
      have_word = true;
      p = q;
    }
    out.push_back(cur);
  }
  if (out.empty()) out.emplace_back();
  return out;
}

const std::vector<std::string>& help_lines() {
  static const std::vector<std::string> lines = [] {
    const int inner = 61;
    const char* rows[] = {
      "",
      "  NAVIGATION",
      "  ──────────",
      "  n, SPACE, →, ENTER       Next slide",
      "  p, ←, BACKSPACE          Previous slide",
      "  f, HOME                  First slide",
      "  l, END                   Last slide",
      "  g  or  <number>g         Go to slide number",
      "",
      "  SCROLLING (for tall slides)",
      "  ───────────────────────────",
      "  j, ↓                     Scroll down",
      "  k, ↑                     Scroll up",
      "",
      "  VIEWS",
      "  ─────",
      "  s                        Toggle speaker notes",
      "  i                        Slide index (ENTER opens)",
      "  h, ?                     This help",
      "  r, Ctrl-L                Refresh/redraw screen",
      "",
      "  q, x, ESC                Quit (closes an open view first)",
      "",
    };
    std::string bar;
    for (int i = 0; i < inner; ++i) bar += "═";
    std::vector<std::string> v;
    v.push_back("╔" + bar + "╗");
    v.push_back("║" + utf8::fit_to_width(centered("SLIDESHOW CONTROLS", inner), inner) + "║");
    v.push_back("╠" + bar + "╣");
    for (const char* r : rows) v.push_back("║" + utf8::fit_to_width(r, inner) + "║");
    v.push_back("╚" + bar + "╝");
    return v;
  }();
  return lines;
}

static std::vector<std::string> notes_rows(const Slide& s, int width) {
  if (!s.has_notes()) return {"  (No speaker notes)"};
  std::vector<std::string> rows = wrap_text(s.notes, std::max(1, width - 4));
  for (auto& r : rows) r.insert(0, "  ");
  return rows;
}

int overlay_line_count(const Deck& deck, const ViewState& view, int width) {
  bool have_slide = !deck.empty() && view.current_index >= 0;
  switch (view.mode) {
    case ViewMode::Notes:
      return have_slide ? static_cast<int>(notes_rows(deck.slide_at(view.current_index), width).size()) : 1;
    case ViewMode::Index: return std::max(1, deck.count());
    case ViewMode::Help: return static_cast<int>(help_lines().size());
    case ViewMode::Normal: break;
  }
  return 0;
}

int overlay_max_scroll(const Deck& deck, const ViewState& view, int width, int height) {
  return std::max(0, overlay_line_count(deck, view, width) - overlay_window(height));
}

static std::string scroll_text(int offset, int max_scroll) {
  if (max_scroll <= 0) return std::string();
  return " ↕" + std::to_string(offset + 1) + "/" + std::to_string(max_scroll + 1);
}

static const char* hint_text(ViewMode m, bool scrollable) {
  switch (m) {
    case ViewMode::Notes: return "[s]close [j/k]scroll [n]ext [p]rev";
    case ViewMode::Index: return "[j/k]move [enter]open [i/esc]close";
    case ViewMode::Help: return "[h/esc]close";
    case ViewMode::Normal: break;
  }
  return scrollable ? "[j/k]scroll [s]notes [n]ext [p]rev [q]uit" : "[s]notes [n]ext [p]rev [h]elp [q]uit";
}

static FrameLine footer_line(const RenderInfo& info, const std::string& scroll) {
  const ViewState& v = info.view;
  std::string left = " " + position_text(*info.deck, v) + scroll;
  if (v.mode != ViewMode::Normal) left += std::string(" ") + mode_name(v.mode);
  if (!info.message.empty()) left += "  " + info.message;
  std::string right = info.opts.hints ? hint_text(v.mode, !scroll.empty()) : "";
  int lw = utf8::display_width(left);
  int rw = utf8::display_width(right);
  std::string line = left;
  if (!right.empty() && lw + 2 + rw <= info.width) {
    line += std::string(static_cast<size_t>(info.width - lw - rw), ' ');
    line += right;
  }
  return make_line(line, info.width, LineStyle::Status);
}

static std::string header_text(const RenderInfo& info) {
  const Deck& deck = *info.deck;
  const ViewState& v = info.view;
  if (v.mode == ViewMode::Index) return " SLIDE INDEX  (" + std::to_string(deck.count()) + " slides)";
  if (v.mode == ViewMode::Help) return " SLIDESHOW CONTROLS";
  if (deck.empty() || v.current_index < 0) return " mslide  (no slides)";
  std::string h = " " + position_text(deck, v) + "  " + deck.slide_at(v.current_index).title;
  if (v.mode == ViewMode::Notes) h += "  (speaker notes)";
  return h;
}

static void fill_rows(Frame& f, size_t target, int width) {
  while (f.size() < target) f.push_back(blank_line(width));
}

// Body region of NORMAL mode; returns the footer scroll indicator.
static std::string render_body(const RenderInfo& info, Frame& f) {
  const int w = info.width;
  const size_t end_row = f.size() + static_cast<size_t>(std::max(0, info.height - kChromeRows));
  const Deck& deck = *info.deck;
  if (deck.empty() || info.view.current_index < 0) {
    int rows = std::max(0, info.height - kChromeRows);
    fill_rows(f, f.size() + static_cast<size_t>(rows / 2), w);
    if (f.size() < end_row) f.push_back(make_line(centered("No slides loaded", w), w, LineStyle::Dim));
    fill_rows(f, end_row, w);
    return std::string();
  }
  const Slide& s = deck.slide_at(info.view.current_index);
  const int n = s.body_line_count();
  BodyLayout l = body_layout(n, info.height);
  if (n == 0) {
    fill_rows(f, f.size() + static_cast<size_t>(l.rows / 2), w);
    if (f.size() < end_row) f.push_back(make_line(centered(s.title, w), w, LineStyle::Title));
    fill_rows(f, end_row, w);
    return std::string();
  }
  int scroll = std::clamp(info.view.scroll_offset, 0, l.max_scroll);
  int left_pad = 0;
  if (info.opts.center) {
    int widest = 0;
    for (const auto& line : s.body_lines) widest = std::max(widest, utf8::display_width(line));
    if (widest < w) left_pad = (w - widest) / 2;
  }
  std::string margin(static_cast<size_t>(left_pad), ' ');
  if (info.opts.center && !l.overflow) fill_rows(f, f.size() + static_cast<size_t>((l.rows - n) / 2), w);
  if (l.markers) {
    if (scroll > 0) f.push_back(make_line(margin + "▲ " + std::to_string(scroll) + " more above", w, LineStyle::Marker));
    else f.push_back(blank_line(w));
  }
  for (int i = 0; i < l.window; ++i) {
    int idx = scroll + i;
    if (idx < n) f.push_back(make_line(margin + s.body_lines[static_cast<size_t>(idx)], w));
    else f.push_back(blank_line(w));
  }
  if (l.markers) {
    int below = n - (scroll + l.window);
    if (below > 0) f.push_back(make_line(margin + "▼ " + std::to_string(below) + " more below", w, LineStyle::Marker));
    else f.push_back(blank_line(w));
  }
  fill_rows(f, end_row, w);
  return scroll_text(scroll, l.max_scroll);
}

static std::string render_overlay(const RenderInfo& info, Frame& f) {
  const int w = info.width;
  const Deck& deck = *info.deck;
  const ViewState& v = info.view;
  const int window = overlay_window(info.height);
  const size_t end_row = f.size() + static_cast<size_t>(window);
  const bool have_slide = !deck.empty() && v.current_index >= 0;

  std::vector<FrameLine> content;
  if (v.mode == ViewMode::Notes) {
    if (!have_slide) {
      content.push_back(make_line("  (No slides loaded)", w, LineStyle::Dim));
    } else {
      const Slide& s = deck.slide_at(v.current_index);
      LineStyle st = s.has_notes() ? LineStyle::Plain : LineStyle::Dim;
      for (const auto& r : notes_rows(s, w)) content.push_back(make_line(r, w, st));
    }
  } else if (v.mode == ViewMode::Index) {
    if (deck.empty()) {
      content.push_back(make_line("  (no slides loaded)", w, LineStyle::Dim));
    } else {
      int digits = std::max(2, static_cast<int>(std::to_string(deck.count()).size()));
      for (const IndexEntry& e : deck.index_entries()) {
        bool selected = e.index - 1 == v.index_selection;
        bool current = e.index - 1 == v.current_index;
        std::string num = std::to_string(e.index);
        std::string row = selected ? "▶" : " ";
        row += current ? "*" : " ";
        row += std::string(static_cast<size_t>(digits) - num.size() + 1, ' ') + num + ". ";
        row += e.title;
        content.push_back(make_line(row, w, selected ? LineStyle::Selected : LineStyle::Plain));
      }
    }
  } else {
    const auto& help = help_lines();
    int widest = 0;
    for (const auto& h : help) widest = std::max(widest, utf8::display_width(h));
    std::string margin(static_cast<size_t>(std::max(0, (w - widest) / 2)), ' ');
    for (const auto& h : help) content.push_back(make_line(margin + h, w));
  }

  int max_scroll = std::max(0, static_cast<int>(content.size()) - window);
  int top = std::clamp(v.overlay_scroll, 0, max_scroll);
  for (int i = 0; i < window && top + i < static_cast<int>(content.size()); ++i) {
    f.push_back(std::move(content[static_cast<size_t>(top + i)]));
  }
  fill_rows(f, end_row, w);
  return scroll_text(top, max_scroll);
}

Frame Renderer::render(const RenderInfo& info) const {
  Frame f;
  if (info.deck == nullptr || info.width <= 0 || info.height <= 0) return f;
  f.reserve(static_cast<size_t>(info.height));
  if (info.height >= kChromeRows) f.push_back(make_line(header_text(info), info.width, LineStyle::Title));
  std::string scroll;
  if (info.height > kChromeRows) {
    scroll = info.view.mode == ViewMode::Normal ? render_body(info, f) : render_overlay(info, f);
  }
  f.push_back(footer_line(info, scroll));
  return f;
}

void Renderer::present(ITerminal& term, const Frame& frame) const {
  term.clear();
  for (int row = 0; row < static_cast<int>(frame.size()); ++row) {
    const FrameLine& l = frame[static_cast<size_t>(row)];
    switch (l.style) {
      case LineStyle::Title: term.draw_colored(row, 0, l.text, kPairTitle); break;
      case LineStyle::Dim: term.draw_colored(row, 0, l.text, kPairDim); break;
      case LineStyle::Marker: term.draw_colored(row, 0, l.text, kPairMarker); break;
      case LineStyle::Status:
      case LineStyle::Selected: term.draw_highlighted(row, 0, l.text, 0, static_cast<int>(l.text.size())); break;
      case LineStyle::Plain: term.draw_text(row, 0, l.text); break;
    }
  }
  term.move_cursor(frame.empty() ? 0 : static_cast<int>(frame.size()) - 1, 0);
  term.refresh();
}

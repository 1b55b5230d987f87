#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kPairTitle, COLOR_CYAN, -1);
      init_pair(kPairPlain, -1, -1);
      init_pair(kPairDim, COLOR_WHITE, -1);
      init_pair(kPairMarker, COLOR_YELLOW, -1);
    } else {
      init_pair(kPairTitle, COLOR_CYAN, COLOR_BLACK); // fallback
      init_pair(kPairPlain, COLOR_WHITE, COLOR_BLACK);
      init_pair(kPairDim, COLOR_WHITE, COLOR_BLACK);
      init_pair(kPairMarker, COLOR_YELLOW, COLOR_BLACK);
    }
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kPairPlain));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(kPairPlain));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  int hl_end = std::min(len, hl_start + hl_len);
  hl_start = std::min(hl_start, len);
  move(row, col);
  if (hl_start > 0) addnstr(text.c_str(), hl_start);
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    addnstr(text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
  }
  if (hl_end < len) addnstr(text.c_str() + hl_end, len - hl_end);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  int attrs = color_pair_id == kPairDim ? A_DIM : (color_pair_id == kPairTitle ? A_BOLD : A_NORMAL);
  attron(attrs);
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
  attroff(attrs);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }


int NcursesTerminal::read_key() { return getch(); }

#include "headless_terminal.hpp"
#include <algorithm>
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) { resize(rows, cols); }

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  grid_.assign(static_cast<size_t>(rows_), std::vector<Cell>(static_cast<size_t>(cols_)));
}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) std::fill(r.begin(), r.end(), Cell{});
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int hl_start, int hl_len, int color) {
  if (row < 0 || row >= rows_) return;
  auto& cells = grid_[static_cast<size_t>(row)];
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    size_t len = 1;
    int w = utf8::char_width(utf8::decode(text, i, len));
    bool rev = static_cast<int>(i) >= hl_start && static_cast<int>(i) < hl_start + hl_len;
    if (col >= 0) {
      Cell& c = cells[static_cast<size_t>(col)];
      c.ch = text.substr(i, len);
      c.reverse = rev;
      c.color = color;
      if (w == 2 && col + 1 < cols_) cells[static_cast<size_t>(col + 1)] = Cell{std::string(), rev, color};
    }
    col += w;
    i += len;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, 0, 0, kPairPlain); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  put(row, col, text, std::max(0, hl_start), std::max(0, hl_len), 0);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, 0, 0, color_pair_id);
}

void HeadlessTerminal::move_cursor(int row, int col) { cur_row_ = row; cur_col_ = col; }

void HeadlessTerminal::refresh() { refreshes_++; }


std::string HeadlessTerminal::row_text(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  for (const auto& c : grid_[static_cast<size_t>(row)]) out += c.ch;
  return out;
}

bool HeadlessTerminal::is_reverse(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return false;
  return grid_[static_cast<size_t>(row)][static_cast<size_t>(col)].reverse;
}

int HeadlessTerminal::color_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return 0;
  return grid_[static_cast<size_t>(row)][static_cast<size_t>(col)].color;
}

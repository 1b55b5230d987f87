#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal that records a cell grid, for automated tests and render checks.
 * Note: one cell per column; a wide character fills its first cell and leaves the next empty.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  ~HeadlessTerminal() override = default;

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;

  void resize(int rows, int cols);
  std::string row_text(int row) const;
  bool is_reverse(int row, int col) const;
  int color_at(int row, int col) const;
  int refresh_count() const { return refreshes_; }
  int cursor_row() const { return cur_row_; }

private:
  struct Cell {
    std::string ch = " ";
    bool reverse = false;
    int color = 0;
  };
  // Writes text from col; bytes [hl_start, hl_start + hl_len) are drawn reversed.
  void put(int row, int col, const std::string& text, int hl_start, int hl_len, int color);

  int rows_;
  int cols_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
  std::vector<std::vector<Cell>> grid_;
};

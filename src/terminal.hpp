#pragma once
/*
 * Terminal
 *
 * Purpose: RAII session for the ncurses screen (newterm/endwin/delscreen).
 * Usage: construct in main once the deck is loaded, check ok(); destructor restores the tty.
 * Note: sets raw/noecho/keypad, hides the cursor, short ESC delay; no rendering here.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  // False when stdin/stdout is not a usable terminal.
  bool ok() const { return screen_ != nullptr; }

private:
  SCREEN* screen_ = nullptr;
};

#include "terminal.hpp"
#include <locale.h>
#include <stdio.h>
#include <unistd.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) return;
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) return;
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  set_escdelay(25);
}

Terminal::~Terminal() {
  if (!screen_) return;
  curs_set(1);
  endwin();
  delscreen(screen_);
}

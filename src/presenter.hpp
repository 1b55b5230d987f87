#pragma once
/*
 * Presenter
 *
 * Purpose: one presentation session; owns terminal backend, key decoder and controller.
 * Loop: blocking read → decode → apply (one frame per command) until Quit.
 * Note: requires an initialized Terminal (ncurses) for its lifetime.
 */
#include "deck.hpp"
#include "config.hpp"
#include "controller.hpp"
#include "input.hpp"
#include "ncurses_terminal.hpp"

class Presenter {
public:
  Presenter(const Deck& deck, const Settings& settings);
  void run();

private:
  void handle_key(int ch);

  NcursesTerminal term;
  Input input;
  Controller controller;
};

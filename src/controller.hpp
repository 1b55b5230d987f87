#pragma once
/*
 * Controller
 *
 * Purpose: navigation state machine over a read-only Deck.
 * State: current slide, body scroll, overlay scroll/selection, view mode (ViewState).
 * Contract: every applied command except Quit ends with exactly one render + present.
 * Note: Next/Prev/Scroll are interpreted per mode (slide vs. index list vs. help text).
 */
#include <string>
#include "deck.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "types.hpp"

enum class ApplyStatus { Ok, InvalidTarget, Quit };

struct ApplyResult {
  ApplyStatus status = ApplyStatus::Ok;
  std::string message;
};

class Controller {
public:
  Controller(const Deck& deck, ITerminal& term, TermSize size, RenderOptions opts = {}, int scroll_step = 1);

  // Draws the first frame.
  void start();
  ApplyResult apply(const Command& cmd);

  const ViewState& state() const { return view_; }
  const Frame& last_frame() const { return last_frame_; }
  int frames_rendered() const { return frames_; }
  bool finished() const { return quit_; }
  TermSize viewport() const { return size_; }
  int max_scroll() const;

  // Footer prompt (e.g. "Go to slide: 12"); shown instead of the status message until cleared.
  void set_prompt(const std::string& prompt) { prompt_ = prompt; }
  void clear_prompt() { prompt_.clear(); }

private:
  void move_slide(int delta);
  void select_slide(int idx);
  void move_selection(int delta);
  void scroll_by(int delta);
  void toggle(ViewMode target);
  void clamp_all();
  void keep_selection_visible();
  void redraw();

  const Deck& deck_;
  ITerminal& term_;
  Renderer renderer_;
  ViewState view_;
  TermSize size_;
  RenderOptions opts_;
  int scroll_step_;
  std::string message_;
  std::string prompt_;
  bool quit_ = false;
  Frame last_frame_;
  int frames_ = 0;
};

#include "controller.hpp"
#include <algorithm>

Controller::Controller(const Deck& deck, ITerminal& term, TermSize size, RenderOptions opts, int scroll_step)
    : deck_(deck), term_(term), size_(size), opts_(opts), scroll_step_(std::max(1, scroll_step)) {
  view_.current_index = deck_.empty() ? -1 : 0;
}

void Controller::start() { redraw(); }

int Controller::max_scroll() const {
  if (deck_.empty() || view_.current_index < 0) return 0;
  return body_layout(deck_.slide_at(view_.current_index).body_line_count(), size_.rows).max_scroll;
}

void Controller::select_slide(int idx) {
  view_.current_index = idx;
  view_.scroll_offset = 0;
  if (view_.mode == ViewMode::Notes) view_.overlay_scroll = 0;
}

void Controller::move_slide(int delta) {
  if (deck_.empty()) return;
  int idx = std::clamp(view_.current_index + delta, 0, deck_.count() - 1);
  if (idx != view_.current_index) select_slide(idx);
}

void Controller::move_selection(int delta) {
  if (deck_.empty()) return;
  view_.index_selection = std::clamp(view_.index_selection + delta, 0, deck_.count() - 1);
  keep_selection_visible();
}

void Controller::keep_selection_visible() {
  int window = overlay_window(size_.rows);
  if (window <= 0) { view_.overlay_scroll = 0; return; }
  if (view_.index_selection < view_.overlay_scroll) view_.overlay_scroll = view_.index_selection;
  if (view_.index_selection >= view_.overlay_scroll + window) view_.overlay_scroll = view_.index_selection - window + 1;
  view_.overlay_scroll = std::clamp(view_.overlay_scroll, 0, overlay_max_scroll(deck_, view_, size_.cols, size_.rows));
}

void Controller::scroll_by(int delta) {
  switch (view_.mode) {
    case ViewMode::Normal:
      view_.scroll_offset = std::clamp(view_.scroll_offset + delta, 0, max_scroll());
      break;
    case ViewMode::Index:
      move_selection(delta > 0 ? 1 : -1);
      break;
    case ViewMode::Notes:
    case ViewMode::Help:
      view_.overlay_scroll = std::clamp(view_.overlay_scroll + delta, 0,
                                        overlay_max_scroll(deck_, view_, size_.cols, size_.rows));
      break;
  }
}

void Controller::toggle(ViewMode target) {
  if (view_.mode == target) {
    view_.mode = ViewMode::Normal;
    view_.overlay_scroll = 0;
    return;
  }
  view_.mode = target;
  view_.overlay_scroll = 0;
  if (target == ViewMode::Index) {
    view_.index_selection = std::max(0, view_.current_index);
    keep_selection_visible();
  }
}

void Controller::clamp_all() {
  view_.scroll_offset = std::clamp(view_.scroll_offset, 0, max_scroll());
  if (view_.mode == ViewMode::Index) {
    keep_selection_visible();
  } else if (view_.mode != ViewMode::Normal) {
    view_.overlay_scroll = std::clamp(view_.overlay_scroll, 0, overlay_max_scroll(deck_, view_, size_.cols, size_.rows));
  }
}

ApplyResult Controller::apply(const Command& cmd) {
  ApplyResult res;
  if (quit_) { res.status = ApplyStatus::Quit; return res; }
  message_.clear();
  using T = Command::Type;
  switch (cmd.type) {
    case T::Next:
    case T::Prev: {
      int d = cmd.type == T::Next ? 1 : -1;
      if (view_.mode == ViewMode::Index) move_selection(d);
      else if (view_.mode != ViewMode::Help) move_slide(d);
    } break;
    case T::ScrollDown: scroll_by(scroll_step_); break;
    case T::ScrollUp: scroll_by(-scroll_step_); break;
    case T::Goto:
      if (cmd.n >= 1 && cmd.n <= deck_.count()) {
        select_slide(cmd.n - 1);
        view_.mode = ViewMode::Normal;
        view_.overlay_scroll = 0;
      } else {
        res.status = ApplyStatus::InvalidTarget;
        res.message = deck_.empty() ? std::string("no slides loaded")
                                    : "no slide " + std::to_string(cmd.n) + " (1-" + std::to_string(deck_.count()) + ")";
        message_ = res.message;
      }
      break;
    case T::First:
    case T::Last:
      if (deck_.empty()) break;
      if (view_.mode == ViewMode::Index) {
        view_.index_selection = cmd.type == T::First ? 0 : deck_.count() - 1;
        keep_selection_visible();
      } else {
        select_slide(cmd.type == T::First ? 0 : deck_.count() - 1);
      }
      break;
    case T::ToggleNotes: toggle(ViewMode::Notes); break;
    case T::ToggleIndex: toggle(ViewMode::Index); break;
    case T::ToggleHelp: toggle(ViewMode::Help); break;
    case T::Resize:
      size_ = TermSize{std::max(0, cmd.height), std::max(0, cmd.width)};
      clamp_all();
      break;
    case T::Refresh: break;
    case T::Quit:
      quit_ = true;
      res.status = ApplyStatus::Quit;
      return res;
  }
  redraw();
  return res;
}

void Controller::redraw() {
  RenderInfo info;
  info.deck = &deck_;
  info.view = view_;
  info.width = size_.cols;
  info.height = size_.rows;
  info.message = prompt_.empty() ? message_ : prompt_;
  info.opts = opts_;
  last_frame_ = renderer_.render(info);
  renderer_.present(term_, last_frame_);
  frames_++;
}

#include "input.hpp"
#include <ncurses.h>

static constexpr int CTRL_c = 'C'-64;
static constexpr int CTRL_l = 'L'-64;
static constexpr int CTRL_h = 'H'-64;
static constexpr int ESC = 27;
static constexpr int DEL = 127;
static constexpr size_t kMaxCount = 1000000;

static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == DEL || ch == CTRL_h; }

static Command cmd(Command::Type t) { return Command::make(t); }

bool Input::consumeDigit(int ch) {
  if (ch >= '1' && ch <= '9') {
    if (pending_count_ < kMaxCount) pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0') {
    if (pending_count_ > 0) {
      if (pending_count_ < kMaxCount) pending_count_ = pending_count_ * 10;
      return true;
    }
  }
  return false;
}

bool Input::hasCount() const {
  return pending_count_ > 0;
}

size_t Input::takeCount() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

std::string Input::prompt_text() const {
  std::string s = "Go to slide: ";
  if (pending_count_ > 0) s += std::to_string(pending_count_);
  return s;
}

void Input::reset() {
  prompting_ = false;
  pending_count_ = 0;
}

std::optional<Command> Input::decode(int ch, ViewMode mode, int index_selection, TermSize size) {
  if (ch == KEY_RESIZE) return Command::resize(size.cols, size.rows);
  if (ch == CTRL_c) { reset(); return cmd(Command::Type::Quit); }
  if (prompting_) return decode_prompt(ch);
  switch (mode) {
    case ViewMode::Index: return decode_index(ch, index_selection);
    case ViewMode::Help: return decode_help(ch);
    case ViewMode::Normal:
    case ViewMode::Notes: break;
  }
  return decode_slide(ch, mode);
}

std::optional<Command> Input::decode_prompt(int ch) {
  if (consumeDigit(ch)) return std::nullopt;
  if (is_backspace(ch)) { pending_count_ /= 10; return std::nullopt; }
  if (ch == ESC) { reset(); return std::nullopt; }
  if (is_enter(ch)) {
    prompting_ = false;
    size_t n = takeCount();
    if (n == 0) return std::nullopt;
    return Command::goto_slide(static_cast<int>(n));
  }
  return std::nullopt;
}

std::optional<Command> Input::decode_index(int ch, int index_selection) {
  pending_count_ = 0;
  using T = Command::Type;
  switch (ch) {
    case 'j': case 'n': case KEY_DOWN: return cmd(T::Next);
    case 'k': case 'p': case KEY_UP: return cmd(T::Prev);
    case 'f': case KEY_HOME: return cmd(T::First);
    case 'l': case 'G': case KEY_END: return cmd(T::Last);
    case ' ': return Command::goto_slide(index_selection + 1);
    case 'q': case 'i': case ESC: return cmd(T::ToggleIndex);
    case 'h': case '?': return cmd(T::ToggleHelp);
    case 'r': case CTRL_l: return cmd(T::Refresh);
    default: break;
  }
  if (is_enter(ch)) return Command::goto_slide(index_selection + 1);
  return std::nullopt;
}

std::optional<Command> Input::decode_help(int ch) {
  pending_count_ = 0;
  using T = Command::Type;
  switch (ch) {
    case 'j': case KEY_DOWN: return cmd(T::ScrollDown);
    case 'k': case KEY_UP: return cmd(T::ScrollUp);
    case 'r': case CTRL_l: return cmd(T::Refresh);
    default: return cmd(T::ToggleHelp);
  }
}

std::optional<Command> Input::decode_slide(int ch, ViewMode mode) {
  using T = Command::Type;
  if (consumeDigit(ch)) return std::nullopt;
  if (ch == 'G' && hasCount()) return Command::goto_slide(static_cast<int>(takeCount()));
  if (ch == 'g' || is_enter(ch)) {
    if (hasCount()) return Command::goto_slide(static_cast<int>(takeCount()));
    if (ch == 'g') { prompting_ = true; return std::nullopt; }
    return cmd(T::Next);
  }
  pending_count_ = 0;
  if (is_backspace(ch)) return cmd(T::Prev);
  switch (ch) {
    case 'n': case ' ': case KEY_RIGHT: case KEY_NPAGE: return cmd(T::Next);
    case 'p': case KEY_LEFT: case KEY_PPAGE: return cmd(T::Prev);
    case 'j': case KEY_DOWN: return cmd(T::ScrollDown);
    case 'k': case KEY_UP: return cmd(T::ScrollUp);
    case 'f': case KEY_HOME: return cmd(T::First);
    case 'l': case 'G': case KEY_END: return cmd(T::Last);
    case 's': return cmd(T::ToggleNotes);
    case 'i': return cmd(T::ToggleIndex);
    case 'h': case '?': return cmd(T::ToggleHelp);
    case 'r': case CTRL_l: return cmd(T::Refresh);
    case 'q': case 'x': case ESC:
      return mode == ViewMode::Notes ? cmd(T::ToggleNotes) : cmd(T::Quit);
    default: break;
  }
  return std::nullopt;
}

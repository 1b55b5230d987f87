#include "input.hpp"
#include <ncurses.h>
#include <cassert>

using T = Command::Type;

static const TermSize kSize{24, 80};

static bool is(const std::optional<Command>& c, T t) { return c && c->type == t; }

static bool is_goto(const std::optional<Command>& c, int n) { return c && c->type == T::Goto && c->n == n; }

static void test_normal_keys() {
  Input in;
  auto d = [&](int ch) { return in.decode(ch, ViewMode::Normal, 0, kSize); };
  assert(is(d('n'), T::Next));
  assert(is(d(' '), T::Next));
  assert(is(d(KEY_RIGHT), T::Next));
  assert(is(d('\n'), T::Next));
  assert(is(d('p'), T::Prev));
  assert(is(d(KEY_LEFT), T::Prev));
  assert(is(d(KEY_BACKSPACE), T::Prev));
  assert(is(d('j'), T::ScrollDown));
  assert(is(d(KEY_UP), T::ScrollUp));
  assert(is(d('f'), T::First));
  assert(is(d(KEY_END), T::Last));
  assert(is(d('G'), T::Last));
  assert(is(d('s'), T::ToggleNotes));
  assert(is(d('i'), T::ToggleIndex));
  assert(is(d('?'), T::ToggleHelp));
  assert(is(d('r'), T::Refresh));
  assert(is(d('q'), T::Quit));
  assert(is(d(27), T::Quit));
  assert(!d('z'));
}

static void test_notes_escape_closes() {
  Input in;
  assert(is(in.decode('q', ViewMode::Notes, 0, kSize), T::ToggleNotes));
  assert(is(in.decode(27, ViewMode::Notes, 0, kSize), T::ToggleNotes));
  assert(is(in.decode('n', ViewMode::Notes, 0, kSize), T::Next));
  assert(is(in.decode('C' - 64, ViewMode::Notes, 0, kSize), T::Quit));
}

static void test_count_prefix() {
  Input in;
  assert(!in.decode('1', ViewMode::Normal, 0, kSize));
  assert(!in.decode('2', ViewMode::Normal, 0, kSize));
  assert(in.hasCount());
  assert(is_goto(in.decode('g', ViewMode::Normal, 0, kSize), 12));
  assert(!in.hasCount());

  assert(!in.decode('3', ViewMode::Normal, 0, kSize));
  assert(is_goto(in.decode('\n', ViewMode::Normal, 0, kSize), 3));

  assert(!in.decode('4', ViewMode::Normal, 0, kSize));
  assert(is_goto(in.decode('G', ViewMode::Normal, 0, kSize), 4));

  // any other key drops the count
  assert(!in.decode('5', ViewMode::Normal, 0, kSize));
  assert(is(in.decode('n', ViewMode::Normal, 0, kSize), T::Next));
  assert(!in.hasCount());

  // leading zero is not a count
  assert(!in.decode('0', ViewMode::Normal, 0, kSize));
  assert(!in.hasCount());
}

static void test_prompt() {
  Input in;
  assert(!in.decode('g', ViewMode::Normal, 0, kSize));
  assert(in.prompting());
  assert(in.prompt_text() == "Go to slide: ");
  assert(!in.decode('4', ViewMode::Normal, 0, kSize));
  assert(!in.decode('2', ViewMode::Normal, 0, kSize));
  assert(in.prompt_text() == "Go to slide: 42");
  assert(!in.decode(KEY_BACKSPACE, ViewMode::Normal, 0, kSize));
  assert(in.prompt_text() == "Go to slide: 4");
  assert(!in.decode('q', ViewMode::Normal, 0, kSize));
  assert(in.prompting());
  assert(is_goto(in.decode('\n', ViewMode::Normal, 0, kSize), 4));
  assert(!in.prompting());

  assert(!in.decode('g', ViewMode::Normal, 0, kSize));
  assert(!in.decode('7', ViewMode::Normal, 0, kSize));
  assert(!in.decode(27, ViewMode::Normal, 0, kSize));
  assert(!in.prompting());
  assert(!in.hasCount());

  // Enter on an empty prompt just closes it
  assert(!in.decode('g', ViewMode::Normal, 0, kSize));
  assert(!in.decode('\r', ViewMode::Normal, 0, kSize));
  assert(!in.prompting());
}

static void test_index_keys() {
  Input in;
  auto d = [&](int ch) { return in.decode(ch, ViewMode::Index, 6, kSize); };
  assert(is(d('j'), T::Next));
  assert(is(d(KEY_UP), T::Prev));
  assert(is(d(KEY_HOME), T::First));
  assert(is(d('G'), T::Last));
  assert(is_goto(d('\n'), 7));
  assert(is_goto(d(' '), 7));
  assert(is(d('i'), T::ToggleIndex));
  assert(is(d(27), T::ToggleIndex));
  assert(is(d('h'), T::ToggleHelp));
  assert(!d('s'));
}

static void test_help_keys() {
  Input in;
  assert(is(in.decode('j', ViewMode::Help, 0, kSize), T::ScrollDown));
  assert(is(in.decode('k', ViewMode::Help, 0, kSize), T::ScrollUp));
  assert(is(in.decode('x', ViewMode::Help, 0, kSize), T::ToggleHelp));
  assert(is(in.decode(27, ViewMode::Help, 0, kSize), T::ToggleHelp));
}

static void test_resize_key() {
  Input in;
  auto c = in.decode(KEY_RESIZE, ViewMode::Index, 0, TermSize{30, 100});
  assert(is(c, T::Resize));
  assert(c->width == 100 && c->height == 30);
}

int main() {
  test_normal_keys();
  test_notes_escape_closes();
  test_count_prefix();
  test_prompt();
  test_index_keys();
  test_help_keys();
  test_resize_key();
  return 0;
}

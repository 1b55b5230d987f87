#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "types.hpp"
#include "iterminal.hpp"
/*
 * Input
 *
 * Purpose: decode raw keys into navigation Commands, per view mode.
 * Extend: count prefix ("12g", "12<Enter>") and a "Go to slide:" prompt opened by a bare 'g'.
 * Note: keeps only key-level state; never touches the deck or the view.
 */

class Input {
public:
  // Returns the command for ch, or nothing when the key only edits count/prompt state.
  std::optional<Command> decode(int ch, ViewMode mode, int index_selection, TermSize size);

  bool consumeDigit(int ch);
  bool hasCount() const;
  size_t takeCount();
  bool prompting() const { return prompting_; }
  std::string prompt_text() const;
  void reset();

private:
  std::optional<Command> decode_prompt(int ch);
  std::optional<Command> decode_index(int ch, int index_selection);
  std::optional<Command> decode_help(int ch);
  std::optional<Command> decode_slide(int ch, ViewMode mode);

  bool prompting_ = false;
  size_t pending_count_ = 0;
};

#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (ViewMode/ViewState/Command).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <string>

enum class ViewMode { Normal, Notes, Index, Help };

// Cursor into the deck; the only mutable state of a running presentation.
struct ViewState {
  int current_index = -1;   // -1 when the deck is empty
  int scroll_offset = 0;    // body lines scrolled past the top
  int overlay_scroll = 0;   // first visible row of the active overlay
  int index_selection = 0;  // highlighted row in the index overlay
  ViewMode mode = ViewMode::Normal;
};

struct Command {
  enum class Type {
    Next, Prev, ScrollDown, ScrollUp, Goto, First, Last,
    ToggleNotes, ToggleIndex, ToggleHelp, Resize, Refresh, Quit
  };
  Type type = Type::Refresh;
  int n = 0;       // Goto: 1-based slide number
  int width = 0;   // Resize
  int height = 0;  // Resize

  static Command make(Type t) { Command c; c.type = t; return c; }
  static Command goto_slide(int n) { Command c; c.type = Type::Goto; c.n = n; return c; }
  static Command resize(int w, int h) { Command c; c.type = Type::Resize; c.width = w; c.height = h; return c; }
};

const char* mode_name(ViewMode m);

#pragma once
/*
 * Config
 *
 * Purpose: presenter settings, from ~/.msliderc and command-line flags.
 * Syntax: one command per line, "set <name> <value>" or "set <name>=<value>";
 * '#', '"' and '//' start comments, a leading ':' is ignored.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "deck.hpp"
#include "renderer.hpp"

struct Settings {
  bool center = true;
  bool hints = true;
  int scroll_step = 1;
  MalformedPolicy on_error = MalformedPolicy::Skip;
  bool require_slides = true;
  std::string extension = ".md";

  RenderOptions render_options() const { return RenderOptions{center, hints}; }
  DeckOptions deck_options() const { return DeckOptions{on_error, require_slides}; }
};

class Config {
public:
  Config();

  // Blank and comment lines succeed without effect.
  bool execute_line(const std::string& line, std::string& msg);
  // A missing file is not an error. Each failing line adds "<file>:<line>: <msg>".
  bool load_rc(const std::filesystem::path& path, std::vector<std::string>& diagnostics);

  Settings settings;

private:
  void register_commands();
  CommandRegistry registry;
};

// $HOME/.msliderc, or nothing when HOME is unset.
std::optional<std::filesystem::path> default_rc_path();

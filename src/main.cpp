#include "terminal.hpp"
#include "presenter.hpp"
#include "config.hpp"
#include "deck.hpp"
#include "slide_loader.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static void usage(std::ostream& os) {
  os << "usage: mslide [options] [slides_dir]\n"
        "  --strict       abort on the first malformed slide\n"
        "  --skip         skip malformed slides with a warning (default)\n"
        "  --allow-empty  start even when no slides were loaded\n"
        "  --rc <path>    read settings from <path> instead of ~/.msliderc\n"
        "  --no-rc        do not read an rc file\n"
        "  -h, --help     show this help\n";
}

int main(int argc, char** argv) {
  std::filesystem::path dir = "slides";
  std::optional<std::filesystem::path> rc = default_rc_path();
  std::optional<MalformedPolicy> policy;
  bool allow_empty = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") { usage(std::cout); return 0; }
    else if (a == "--strict") policy = MalformedPolicy::Abort;
    else if (a == "--skip") policy = MalformedPolicy::Skip;
    else if (a == "--allow-empty") allow_empty = true;
    else if (a == "--no-rc") rc.reset();
    else if (a == "--rc") {
      if (i + 1 >= argc) { std::cerr << "mslide: --rc needs a path\n"; return 2; }
      rc = std::filesystem::path(argv[++i]);
    }
    else if (!a.empty() && a[0] == '-') { std::cerr << "mslide: unknown option " << a << "\n"; usage(std::cerr); return 2; }
    else dir = a;
  }

  Config config;
  if (rc) {
    std::vector<std::string> diags;
    config.load_rc(*rc, diags);
    for (const auto& d : diags) std::cerr << "mslide: " << d << "\n";
  }
  if (policy) config.settings.on_error = *policy;
  if (allow_empty) config.settings.require_slides = false;

  std::vector<SlideSource> sources;
  std::string msg;
  if (!load_slide_sources(dir, config.settings.extension, sources, msg)) {
    std::cerr << "Error: " << msg << "\n";
    return 1;
  }

  Deck deck;
  DeckReport rep = build_deck(sources, config.settings.deck_options(), deck);
  for (const auto& e : rep.skipped) std::cerr << "mslide: skipped slide " << e.position << " (" << e.document << "): " << e.message << "\n";
  for (const auto& w : rep.warnings) std::cerr << "mslide: warning: " << w << "\n";
  if (!rep.ok()) {
    std::cerr << "Error: " << rep.message << " (" << dir.string() << ")\n";
    return 1;
  }
  std::cout << "Loading " << deck.count() << " slides..." << std::endl;

  {
    Terminal term;
    if (!term.ok()) {
      std::cerr << "Error: not a terminal; mslide needs an interactive tty\n";
      return 1;
    }
    Presenter presenter(deck, config.settings);
    presenter.run();
  }
  std::cout << "Slideshow ended." << std::endl;
  return 0;
}

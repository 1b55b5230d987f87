#pragma once
/*
 * Deck
 *
 * Purpose: ordered, read-only collection of slides built once at startup.
 * Invariant: slide i (0-based) has index i + 1; an empty deck is representable.
 * Policy: malformed documents are skipped (with diagnostics) or abort the build.
 */
#include <ranges>
#include <string>
#include <string_view>
#include <vector>
#include "slide.hpp"
#include "slide_parser.hpp"

struct SlideSource {
  std::string name;  // ordering key, e.g. the file name
  std::string text;
};

enum class MalformedPolicy { Skip, Abort };

struct DeckOptions {
  MalformedPolicy on_error = MalformedPolicy::Skip;
  bool require_slides = true;
};

enum class DeckStatus { Ok, ParseFailed, Empty };

struct DeckReport {
  DeckStatus status = DeckStatus::Ok;
  std::vector<ParseError> skipped;
  std::vector<std::string> warnings;
  std::string message;
  bool ok() const { return status == DeckStatus::Ok; }
};

struct IndexEntry {
  int index;
  std::string_view title;
};

class Deck {
public:
  Deck() = default;
  explicit Deck(std::vector<Slide> slides);

  int count() const { return static_cast<int>(slides_.size()); }
  bool empty() const { return slides_.empty(); }
  // 0-based; throws std::out_of_range outside [0, count).
  const Slide& slide_at(int i) const;

  // Lazy (index, title) pairs in presentation order.
  auto index_entries() const {
    return slides_ | std::views::transform([](const Slide& s) { return IndexEntry{s.index, s.title}; });
  }

private:
  std::vector<Slide> slides_;
};

// docs must already be in presentation order (sorted by name).
DeckReport build_deck(const std::vector<SlideSource>& docs, const DeckOptions& opts, Deck& out);

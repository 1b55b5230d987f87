#include "deck.hpp"
#include <stdexcept>
#include <utility>

Deck::Deck(std::vector<Slide> slides) : slides_(std::move(slides)) {
  for (size_t i = 0; i < slides_.size(); ++i) slides_[i].index = static_cast<int>(i) + 1;
}

const Slide& Deck::slide_at(int i) const {
  if (i < 0 || i >= count()) {
    throw std::out_of_range("slide_at: index " + std::to_string(i) + " outside deck of " + std::to_string(count()));
  }
  return slides_[static_cast<size_t>(i)];
}

DeckReport build_deck(const std::vector<SlideSource>& docs, const DeckOptions& opts, Deck& out) {
  DeckReport rep;
  std::vector<Slide> slides;
  slides.reserve(docs.size());
  for (size_t pos = 0; pos < docs.size(); ++pos) {
    const SlideSource& doc = docs[pos];
    int expected = static_cast<int>(slides.size()) + 1;
    Slide s;
    std::string m;
    if (!parse_slide(doc.text, expected, s, m)) {
      ParseError err{doc.name, static_cast<int>(pos) + 1, m};
      if (opts.on_error == MalformedPolicy::Abort) {
        rep.status = DeckStatus::ParseFailed;
        rep.message = doc.name + ": " + m;
        rep.skipped.push_back(std::move(err));
        out = Deck();
        return rep;
      }
      rep.skipped.push_back(std::move(err));
      continue;
    }
    s.source_name = doc.name;
    if (s.declared_number && *s.declared_number != expected) {
      rep.warnings.push_back(doc.name + ": heading says slide " + std::to_string(*s.declared_number) +
                             ", shown as slide " + std::to_string(expected));
    }
    slides.push_back(std::move(s));
  }

  if (slides.empty() && opts.require_slides) {
    rep.status = DeckStatus::Empty;
    rep.message = docs.empty() ? "no slide documents found" : "no usable slides (all documents malformed)";
    out = Deck();
    return rep;
  }
  out = Deck(std::move(slides));
  if (!rep.skipped.empty()) {
    rep.message = "skipped " + std::to_string(rep.skipped.size()) + " malformed slide(s)";
  } else {
    rep.message = "loaded " + std::to_string(out.count()) + " slide(s)";
  }
  return rep;
}

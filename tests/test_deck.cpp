#include "deck.hpp"
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

static SlideSource doc(const std::string& name, const std::string& text) { return SlideSource{name, text}; }

static void test_build_in_order() {
  std::vector<SlideSource> docs = {
    doc("01-intro.md", "# Intro\n```\nhello\n```\n"),
    doc("02-body.md", "# Body\n"),
    doc("03-end.md", "# End\n## Speaker Notes\nbye\n"),
  };
  Deck d;
  DeckReport rep = build_deck(docs, DeckOptions{}, d);
  assert(rep.ok());
  assert(d.count() == 3);
  for (int i = 0; i < d.count(); ++i) assert(d.slide_at(i).index == i + 1);
  assert(d.slide_at(2).notes == "bye");
  assert(d.slide_at(0).source_name == "01-intro.md");

  std::vector<std::string> titles;
  int expect = 1;
  for (const IndexEntry& e : d.index_entries()) {
    assert(e.index == expect++);
    titles.emplace_back(e.title);
  }
  assert((titles == std::vector<std::string>{"Intro", "Body", "End"}));
}

static void test_slide_at_bounds() {
  Deck d(std::vector<Slide>(2));
  bool thrown = false;
  try { (void)d.slide_at(2); } catch (const std::out_of_range&) { thrown = true; }
  assert(thrown);
  thrown = false;
  try { (void)d.slide_at(-1); } catch (const std::out_of_range&) { thrown = true; }
  assert(thrown);
  assert(d.slide_at(1).index == 2);
}

static void test_empty() {
  Deck d;
  DeckReport rep = build_deck({}, DeckOptions{MalformedPolicy::Skip, true}, d);
  assert(rep.status == DeckStatus::Empty);
  assert(!rep.message.empty());
  assert(d.count() == 0);

  rep = build_deck({}, DeckOptions{MalformedPolicy::Skip, false}, d);
  assert(rep.ok());
  assert(d.empty());
}

static void test_malformed_policies() {
  std::vector<SlideSource> docs = {
    doc("a.md", "# A\n"),
    doc("b.md", "no heading here\n"),
    doc("c.md", "# C\n"),
  };
  Deck d;
  DeckReport rep = build_deck(docs, DeckOptions{MalformedPolicy::Skip, true}, d);
  assert(rep.ok());
  assert(d.count() == 2);
  assert(d.slide_at(1).title == "C");
  assert(d.slide_at(1).index == 2);
  assert(rep.skipped.size() == 1);
  assert(rep.skipped[0].document == "b.md");
  assert(rep.skipped[0].position == 2);

  rep = build_deck(docs, DeckOptions{MalformedPolicy::Abort, true}, d);
  assert(rep.status == DeckStatus::ParseFailed);
  assert(rep.message.find("b.md") != std::string::npos);
  assert(d.empty());

  std::vector<SlideSource> bad = { doc("x.md", "nothing\n") };
  rep = build_deck(bad, DeckOptions{MalformedPolicy::Skip, true}, d);
  assert(rep.status == DeckStatus::Empty);
  rep = build_deck(bad, DeckOptions{MalformedPolicy::Skip, false}, d);
  assert(rep.ok());
  assert(d.count() == 0);
  assert(rep.skipped.size() == 1);
}

static void test_declared_number_mismatch() {
  std::vector<SlideSource> docs = { doc("01.md", "# 05. Misnumbered\n"), doc("02.md", "# 02. Fine\n") };
  Deck d;
  DeckReport rep = build_deck(docs, DeckOptions{}, d);
  assert(rep.ok());
  assert(d.slide_at(0).index == 1);
  assert(rep.warnings.size() == 1);
  assert(rep.warnings[0].find("01.md") != std::string::npos);
}

int main() {
  test_build_in_order();
  test_slide_at_bounds();
  test_empty();
  test_malformed_policies();
  test_declared_number_mismatch();
  return 0;
}

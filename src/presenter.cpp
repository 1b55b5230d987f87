#include "presenter.hpp"

Presenter::Presenter(const Deck& deck, const Settings& settings)
    : controller(deck, term, term.getSize(), settings.render_options(), settings.scroll_step) {}

void Presenter::run() {
  controller.start();
  while (!controller.finished()) {
    int ch = term.read_key();
    if (ch == ERR) continue;
    handle_key(ch);
  }
}

void Presenter::handle_key(int ch) {
  bool was_prompting = input.prompting();
  const ViewState& v = controller.state();
  auto cmd = input.decode(ch, v.mode, v.index_selection, term.getSize());
  if (input.prompting()) controller.set_prompt(input.prompt_text());
  else controller.clear_prompt();
  if (cmd) {
    controller.apply(*cmd);
  } else if (was_prompting || input.prompting()) {
    controller.apply(Command::make(Command::Type::Refresh));
  }
}

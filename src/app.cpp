#include "app.hpp"
#include <utility>

App::App(ITerminal& term, GameSession game, bool enable_color)
  : term_(term), game_(std::move(game)), enable_color_(enable_color) {}

void App::run() {
  while (!should_quit_) {
    render();
    auto ev = term_.read_event();
    if (!ev) break;
    handle_event(*ev);
  }
}

void App::handle_event(const InputEvent& ev) {
  if (action_for(ev) == Action::Quit) { should_quit_ = true; return; }
  game_.handle_event(ev);
}

void App::render() {
  renderer_.render(term_, game_, message, enable_color_);
}

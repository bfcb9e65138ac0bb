#pragma once
/*
 * App
 *
 * Purpose: event loop; render, read one event, apply it, repeat.
 * Note: Ctrl-C quits; the loop also ends when the terminal has no more input.
 */
#include <string>
#include "game_session.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"

class App {
public:
  App(ITerminal& term, GameSession game, bool enable_color);
  void run();
  void handle_event(const InputEvent& ev);

  const GameSession& game() const { return game_; }
  bool should_quit() const { return should_quit_; }
  std::string message;

private:
  void render();

  ITerminal& term_;
  GameSession game_;
  Renderer renderer_;
  bool enable_color_;
  bool should_quit_ = false;
};

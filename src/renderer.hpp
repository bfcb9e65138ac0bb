#pragma once
/*
 * Renderer
 *
 * Purpose: draw the status line, the field (two columns per cell, checkerboard
 * background) and the message line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; reads the session, never mutates it.
 */
#include <string>
#include "game_session.hpp"
#include "iterminal.hpp"
#include "types.hpp"

std::string status_text(const GameSession& game);
std::string cell_glyph(const CellView& cell, bool enable_color);
int cell_pair(const CellView& cell, Coord c);
int status_pair(GameStatus status);

class Renderer {
public:
  void render(ITerminal& term,
              const GameSession& game,
              const std::string& message,
              bool enable_color);
};

#include "renderer.hpp"

std::string status_text(const GameSession& game) {
  switch (game.status()) {
    case GameStatus::Win: return "You won!";
    case GameStatus::Loss: return "You lost!";
    case GameStatus::InProgress: break;
  }
  return std::to_string(game.flags_remaining()) + " flags remaining";
}

std::string cell_glyph(const CellView& cell, bool enable_color) {
  if (!cell.is_opened) {
    if (cell.is_flagged) return " P";
    return enable_color ? "  " : " .";
  }
  if (cell.is_mined) return " *";
  if (cell.neighbor_mines == 0) return "  ";
  return " " + std::to_string(cell.neighbor_mines);
}

int cell_pair(const CellView& cell, Coord c) {
  bool light = (c.row + c.col) % 2 == 1;
  if (!cell.is_opened) {
    if (cell.is_flagged) return light ? PAIR_FLAG_LIGHT : PAIR_FLAG_DARK;
    return light ? PAIR_CLOSED_LIGHT : PAIR_CLOSED_DARK;
  }
  if (cell.is_mined) return light ? PAIR_MINE_LIGHT : PAIR_MINE_DARK;
  if (cell.neighbor_mines == 0) return light ? PAIR_OPENED_LIGHT : PAIR_OPENED_DARK;
  return light ? PAIR_COUNT_LIGHT : PAIR_COUNT_DARK;
}

int status_pair(GameStatus status) {
  switch (status) {
    case GameStatus::Win: return PAIR_STATUS_WON;
    case GameStatus::Loss: return PAIR_STATUS_LOST;
    case GameStatus::InProgress: break;
  }
  return PAIR_STATUS;
}

void Renderer::render(ITerminal& term,
                      const GameSession& game,
                      const std::string& message,
                      bool enable_color) {
  term.clear();
  std::string status = status_text(game);
  if (enable_color) term.draw_colored(0, 0, status, status_pair(game.status()));
  else term.draw_text(0, 0, status);
  term.clear_to_eol(0, static_cast<int>(status.size()));

  const Minefield& field = game.field();
  Coord origin = game.origin();
  for (Coord c : field.all()) {
    CellView cell = field.cell_at(c);
    int row = static_cast<int>(origin.row + c.row);
    int col = static_cast<int>(origin.col + GameSession::CELL_WIDTH * c.col);
    std::string glyph = cell_glyph(cell, enable_color);
    if (enable_color) term.draw_colored(row, col, glyph, cell_pair(cell, c));
    else term.draw_text(row, col, glyph);
  }

  if (!message.empty()) {
    int row = static_cast<int>(origin.row + field.size().row) + 1;
    term.draw_text(row, 0, message);
    term.clear_to_eol(row, static_cast<int>(message.size()));
  }
  term.move_cursor(0, 0);
  term.refresh();
}

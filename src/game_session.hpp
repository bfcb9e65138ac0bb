#pragma once
/*
 * GameSession
 *
 * Purpose: one game: the minefield, win/loss status and the screen origin.
 * Input: pointer events are translated from screen cells (two columns per
 * field cell) to field coordinates; anything outside the field is ignored.
 * Status: monotonic; after Win/Loss the field no longer changes.
 */
#include <optional>
#include <string>
#include "config.hpp"
#include "input.hpp"
#include "minefield.hpp"
#include "types.hpp"

class GameSession {
public:
  static constexpr unsigned CELL_WIDTH = 2;

  explicit GameSession(Minefield field, Coord origin = Coord{1, 1});
  static std::optional<GameSession> create(const GameConfig& cfg, std::string& msg);

  void handle_event(const InputEvent& ev);
  void reveal(Coord c);
  void toggle_flag(Coord c);

  std::optional<Coord> to_cell(int raw_row, int raw_col) const;

  GameStatus status() const { return status_; }
  const Minefield& field() const { return field_; }
  Coord origin() const { return origin_; }
  int flags_remaining() const;

private:
  void apply(ClickResult r);

  Minefield field_;
  Coord origin_;
  GameStatus status_ = GameStatus::InProgress;
};

#include "game_session.hpp"
#include <random>
#include <utility>

GameSession::GameSession(Minefield field, Coord origin)
  : field_(std::move(field)), origin_(origin) {}

std::optional<GameSession> GameSession::create(const GameConfig& cfg, std::string& msg) {
  uint32_t seed = 0;
  if (cfg.seed) {
    seed = *cfg.seed;
  } else {
    std::random_device rd;
    seed = rd();
  }
  auto field = Minefield::create(Coord{cfg.rows, cfg.cols}, cfg.mines, seed, msg);
  if (!field) return std::nullopt;
  return GameSession(std::move(*field));
}

void GameSession::handle_event(const InputEvent& ev) {
  if (status_ != GameStatus::InProgress) return;
  if (ev.type != InputEvent::Type::Pointer) return;
  Action a = action_for(ev);
  if (a != Action::Reveal && a != Action::ToggleFlag) return;
  auto c = to_cell(ev.row, ev.col);
  if (!c) return;
  if (a == Action::Reveal) reveal(*c);
  else toggle_flag(*c);
}

void GameSession::reveal(Coord c) {
  if (status_ != GameStatus::InProgress) return;
  apply(field_.handle_click(c));
}

void GameSession::toggle_flag(Coord c) {
  if (status_ != GameStatus::InProgress) return;
  apply(field_.handle_force_click(c));
}

void GameSession::apply(ClickResult r) {
  if (r == ClickResult::Exploded) {
    status_ = GameStatus::Loss;
    // TODO: reveal the remaining mines on loss
  } else if (field_.all_safe_cells_opened()) {
    status_ = GameStatus::Win;
  }
}

std::optional<Coord> GameSession::to_cell(int raw_row, int raw_col) const {
  if (raw_row < static_cast<int>(origin_.row) || raw_col < static_cast<int>(origin_.col)) return std::nullopt;
  Coord c{static_cast<unsigned>(raw_row) - origin_.row,
          (static_cast<unsigned>(raw_col) - origin_.col) / CELL_WIDTH};
  Coord size = field_.size();
  if (c.row >= size.row || c.col >= size.col) return std::nullopt;
  return c;
}

int GameSession::flags_remaining() const {
  return static_cast<int>(field_.mine_count()) - static_cast<int>(field_.flag_count());
}

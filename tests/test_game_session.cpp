#include "game_session.hpp"
#include <cassert>
#include <string>
#include <utility>
#include <vector>

// 3x3 field with a single mine in the top-left corner.
static GameSession corner_mine_game() {
  std::string msg;
  auto f = Minefield::from_layout(Coord{3, 3}, {{0, 0}}, msg);
  assert(f);
  return GameSession(std::move(*f));
}

static void test_win_after_all_safe_cells() {
  GameSession g = corner_mine_game();
  g.reveal({0, 1});
  g.reveal({1, 0});
  g.reveal({1, 1});
  assert(g.status() == GameStatus::InProgress);
  assert(g.field().opened_count() == 3);
  g.reveal({2, 2});
  assert(g.field().opened_count() == 8);
  assert(g.status() == GameStatus::Win);

  // status is final
  g.reveal({0, 0});
  assert(g.status() == GameStatus::Win);
  assert(!g.field().cell_at({0, 0}).is_opened);
}

static void test_loss_on_mine() {
  GameSession g = corner_mine_game();
  g.reveal({0, 1});
  g.reveal({0, 0});
  assert(g.status() == GameStatus::Loss);
  unsigned opened = g.field().opened_count();
  g.reveal({2, 2});
  g.toggle_flag({2, 0});
  assert(g.status() == GameStatus::Loss);
  assert(g.field().opened_count() == opened);
  assert(!g.field().cell_at({2, 0}).is_flagged);
  // remaining mines are not revealed on loss
  assert(!g.field().cell_at({2, 2}).is_opened);
}

// Mine in the center; every safe cell but (2,2) is opened before the mine.
static void test_loss_with_one_safe_cell_left() {
  std::string msg;
  auto f = Minefield::from_layout(Coord{3, 3}, {{1, 1}}, msg);
  assert(f);
  GameSession g(std::move(*f));
  const Coord safe[] = {{0, 0}, {0, 1}, {0, 2}, {1, 0}, {1, 2}, {2, 0}, {2, 1}};
  for (Coord c : safe) g.reveal(c);
  assert(g.status() == GameStatus::InProgress);
  assert(g.field().opened_count() == 7);

  g.reveal({1, 1});
  assert(g.status() == GameStatus::Loss);
  assert(!g.field().all_safe_cells_opened());
  assert(!g.field().cell_at({2, 2}).is_opened);
  g.reveal({2, 2});
  assert(g.status() == GameStatus::Loss);
}

static void test_to_cell() {
  std::string msg;
  GameConfig cfg;
  auto g = GameSession::create(cfg, msg);
  assert(g);
  assert((g->to_cell(1, 1) == Coord{0, 0}));
  assert((g->to_cell(1, 2) == Coord{0, 0}));
  assert((g->to_cell(1, 3) == Coord{0, 1}));
  assert((g->to_cell(10, 20) == Coord{9, 9}));
  assert(!g->to_cell(0, 0));
  assert(!g->to_cell(1, 0));
  assert(!g->to_cell(0, 1));
  assert(!g->to_cell(11, 1));
  assert(!g->to_cell(1, 21));
  assert(!g->to_cell(-1, 5));
}

static void test_pointer_events() {
  GameSession g = corner_mine_game();
  // release and drag never act
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Up, 1, 3));
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Drag, 1, 3));
  assert(g.field().opened_count() == 0);

  // right click and shift+left toggle flags
  g.handle_event(InputEvent::pointer(PointerButton::Right, PointerKind::Down, 1, 1));
  assert(g.field().cell_at({0, 0}).is_flagged);
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Down, 1, 2, MOD_SHIFT));
  assert(!g.field().cell_at({0, 0}).is_flagged);

  // other modifier combinations are ignored
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Down, 1, 3, MOD_CTRL));
  g.handle_event(InputEvent::pointer(PointerButton::Right, PointerKind::Down, 1, 3, MOD_SHIFT));
  assert(g.field().opened_count() == 0);
  assert(g.field().flag_count() == 0);

  // outside the field
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Down, 0, 0));
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Down, 1, 7));
  assert(g.field().opened_count() == 0);

  // keys are not game input
  g.handle_event(InputEvent::key('x'));
  assert(g.status() == GameStatus::InProgress);

  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Down, 1, 3));
  assert(g.field().cell_at({0, 1}).is_opened);
  g.handle_event(InputEvent::pointer(PointerButton::Left, PointerKind::Down, 1, 1));
  assert(g.status() == GameStatus::Loss);
}

static void test_flags_remaining() {
  std::string msg;
  GameConfig cfg;
  cfg.seed = 5;
  auto g = GameSession::create(cfg, msg);
  assert(g);
  assert(g->flags_remaining() == 10);
  g->toggle_flag({0, 0});
  g->toggle_flag({9, 9});
  assert(g->flags_remaining() == 8);
  for (unsigned c = 0; c < 10; ++c) g->toggle_flag({5, c});
  assert(g->flags_remaining() == -2);
  // flagging before the first reveal does not place mines
  assert(!g->field().mines_allocated());
}

static void test_create_validates_config() {
  std::string msg;
  GameConfig cfg;
  cfg.rows = 3;
  cfg.cols = 3;
  cfg.mines = 1;
  assert(!GameSession::create(cfg, msg));
  assert(!msg.empty());

  cfg.rows = 4;
  cfg.cols = 4;
  cfg.mines = 7;
  cfg.seed = 9;
  msg.clear();
  auto g = GameSession::create(cfg, msg);
  assert(g);
  assert(msg.empty());
  assert(g->field().mine_count() == 7);
}

int main() {
  test_win_after_all_safe_cells();
  test_loss_on_mine();
  test_loss_with_one_safe_cell_left();
  test_to_cell();
  test_pointer_events();
  test_flags_remaining();
  test_create_validates_config();
  return 0;
}

#pragma once
/*
 * Minefield
 *
 * Purpose: mine layout plus opened/flagged state, click handling and reveal.
 * Lifecycle: created without mines; the first reveal places them so the
 * clicked cell and its neighbors are never mined.
 * Errors: create/from_layout return nullopt and fill msg on bad input.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "grid.hpp"
#include "types.hpp"

class Minefield {
public:
  static bool validate(Coord size, unsigned n_mines, std::string& msg);
  static std::optional<Minefield> create(Coord size, unsigned n_mines, uint32_t seed, std::string& msg);
  static std::optional<Minefield> from_layout(Coord size, const std::vector<Coord>& mines, std::string& msg);

  void allocate_mines(Coord start);
  ClickResult handle_click(Coord c);
  ClickResult handle_force_click(Coord c);
  void open_at(Coord c);

  CellView cell_at(Coord c) const;
  Coord size() const { return size_; }
  unsigned mine_count() const { return n_mines_; }
  size_t cell_count() const { return static_cast<size_t>(size_.row) * size_.col; }
  unsigned opened_count() const { return opened_.count(); }
  unsigned flag_count() const { return flags_.count(); }
  bool mines_allocated() const { return mines_allocated_; }
  bool all_safe_cells_opened() const;
  GridRange all() const { return GridRange::all(size_); }

private:
  Minefield(Coord size, unsigned n_mines, uint32_t seed);

  Coord size_;
  unsigned n_mines_;
  bool mines_allocated_ = false;
  std::mt19937 rng_;

  Grid<bool> mines_;
  Grid<bool> opened_;
  Grid<bool> flags_;
};

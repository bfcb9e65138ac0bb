#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Coord/GameStatus/CellView).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <functional>

struct Coord {
  unsigned row = 0;
  unsigned col = 0;
  bool operator==(const Coord& o) const { return row == o.row && col == o.col; }
  bool operator!=(const Coord& o) const { return !(*this == o); }
};

namespace std {
template <>
struct hash<Coord> {
  size_t operator()(const Coord& c) const noexcept {
    return hash<unsigned long long>{}((static_cast<unsigned long long>(c.row) << 32) | c.col);
  }
};
}

enum class GameStatus { InProgress, Win, Loss };

enum class ClickResult { Safe, Exploded };

// Render-ready state of one cell.
struct CellView {
  bool is_opened = false;
  bool is_mined = false;
  bool is_flagged = false;
  unsigned neighbor_mines = 0;
};

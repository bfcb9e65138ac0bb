#include "minefield.hpp"
#include <algorithm>
#include <unordered_set>

Minefield::Minefield(Coord size, unsigned n_mines, uint32_t seed)
  : size_(size), n_mines_(n_mines), rng_(seed), mines_(size), opened_(size), flags_(size) {}

bool Minefield::validate(Coord size, unsigned n_mines, std::string& msg) {
  if (size.row == 0 || size.col == 0) {
    msg = "field must have at least one row and one column";
    return false;
  }
  // the first click may rule out up to a full 3x3 block
  size_t safe_zone = std::min(3u, size.row) * std::min(3u, size.col);
  size_t eligible = static_cast<size_t>(size.row) * size.col - safe_zone;
  if (n_mines > eligible) {
    msg = "too many mines: " + std::to_string(n_mines) + " requested, at most "
        + std::to_string(eligible) + " fit a " + std::to_string(size.row) + "x"
        + std::to_string(size.col) + " field";
    return false;
  }
  return true;
}

std::optional<Minefield> Minefield::create(Coord size, unsigned n_mines, uint32_t seed, std::string& msg) {
  if (!validate(size, n_mines, msg)) return std::nullopt;
  return Minefield(size, n_mines, seed);
}

std::optional<Minefield> Minefield::from_layout(Coord size, const std::vector<Coord>& mines, std::string& msg) {
  if (size.row == 0 || size.col == 0) {
    msg = "field must have at least one row and one column";
    return std::nullopt;
  }
  Minefield f(size, static_cast<unsigned>(mines.size()), 0);
  for (Coord c : mines) {
    if (c.row >= size.row || c.col >= size.col) {
      msg = "mine out of bounds: " + std::to_string(c.row) + "," + std::to_string(c.col);
      return std::nullopt;
    }
    if (f.mines_.get(c)) {
      msg = "duplicate mine: " + std::to_string(c.row) + "," + std::to_string(c.col);
      return std::nullopt;
    }
    f.mines_.set(c, true);
  }
  f.mines_allocated_ = true;
  return f;
}

void Minefield::allocate_mines(Coord start) {
  std::unordered_set<Coord> excluded;
  for (Coord c : mines_.around(start)) excluded.insert(c);
  std::vector<Coord> candidates;
  candidates.reserve(cell_count());
  for (Coord c : all()) {
    if (excluded.find(c) == excluded.end()) candidates.push_back(c);
  }
  std::shuffle(candidates.begin(), candidates.end(), rng_);
  for (unsigned i = 0; i < n_mines_; ++i) mines_.set(candidates[i], true);
  mines_allocated_ = true;
}

ClickResult Minefield::handle_click(Coord c) {
  if (!mines_allocated_) allocate_mines(c);
  if (flags_.get(c)) return ClickResult::Safe;
  open_at(c);
  return mines_.get(c) ? ClickResult::Exploded : ClickResult::Safe;
}

ClickResult Minefield::handle_force_click(Coord c) {
  if (!opened_.get(c)) flags_.set(c, !flags_.get(c));
  return ClickResult::Safe;
}

void Minefield::open_at(Coord c) {
  if (opened_.get(c)) return;
  // cells are marked opened when pushed, so each is visited once
  std::vector<Coord> pending;
  opened_.set(c, true);
  flags_.set(c, false);
  pending.push_back(c);
  while (!pending.empty()) {
    Coord cur = pending.back();
    pending.pop_back();
    if (mines_.get(cur) || mines_.sum_neighbors(cur) > 0) continue;
    for (Coord n : opened_.around(cur)) {
      if (opened_.get(n) || mines_.get(n)) continue;
      opened_.set(n, true);
      flags_.set(n, false);
      pending.push_back(n);
    }
  }
}

// an opened mine never counts toward a win
bool Minefield::all_safe_cells_opened() const {
  size_t safe_opened = 0;
  for (Coord c : all()) {
    if (opened_.get(c) && !mines_.get(c)) ++safe_opened;
  }
  return safe_opened == cell_count() - n_mines_;
}

CellView Minefield::cell_at(Coord c) const {
  CellView v;
  v.is_opened = opened_.get(c);
  v.is_mined = mines_.get(c);
  v.is_flagged = flags_.get(c);
  v.neighbor_mines = mines_.sum_neighbors(c);
  return v;
}

#pragma once
/*
 * Grid
 *
 * Purpose: fixed-size row-major 2D storage addressed by Coord.
 * Iteration: GridRange yields coordinates lazily (whole grid or the clipped
 * 3x3 block around a cell); ranges are cheap values and can be re-iterated.
 * Note: get/set do not bounds-check, coordinates come from GridRange or from
 * the session's translation.
 */
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <vector>
#include "types.hpp"

class GridRange {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Coord;
    using difference_type = std::ptrdiff_t;
    using pointer = const Coord*;
    using reference = Coord;

    iterator() = default;
    iterator(Coord cur, unsigned first_col, unsigned end_col)
      : cur_(cur), first_col_(first_col), end_col_(end_col) {}

    Coord operator*() const { return cur_; }
    iterator& operator++() {
      if (++cur_.col >= end_col_) { cur_.col = first_col_; ++cur_.row; }
      return *this;
    }
    iterator operator++(int) { iterator t = *this; ++*this; return t; }
    bool operator==(const iterator& o) const { return cur_ == o.cur_; }
    bool operator!=(const iterator& o) const { return !(*this == o); }

  private:
    Coord cur_{};
    unsigned first_col_ = 0;
    unsigned end_col_ = 0;
  };

  // [start, end) on both axes
  GridRange(Coord start, Coord end) : start_(start), end_(end) {
    if (start_.row >= end_.row || start_.col >= end_.col) end_ = start_;
  }

  static GridRange all(Coord size) { return GridRange({0, 0}, size); }

  static GridRange around(Coord size, Coord c) {
    Coord start{c.row > 0 ? c.row - 1 : 0, c.col > 0 ? c.col - 1 : 0};
    Coord end{std::min(c.row + 2, size.row), std::min(c.col + 2, size.col)};
    return GridRange(start, end);
  }

  iterator begin() const { return iterator(start_, start_.col, end_.col); }
  iterator end() const {
    if (start_ == end_) return begin();
    return iterator(Coord{end_.row, start_.col}, start_.col, end_.col);
  }
  size_t size() const {
    return static_cast<size_t>(end_.row - start_.row) * (end_.col - start_.col);
  }
  bool contains(Coord c) const {
    return c.row >= start_.row && c.row < end_.row && c.col >= start_.col && c.col < end_.col;
  }

private:
  Coord start_;
  Coord end_;
};

template <typename T>
class Grid {
public:
  explicit Grid(Coord size)
    : size_(size), data_(static_cast<size_t>(size.row) * size.col, T{}) {}

  Coord size() const { return size_; }
  T get(Coord c) const { return data_[position(c)]; }
  void set(Coord c, T value) { data_[position(c)] = value; }

  GridRange all() const { return GridRange::all(size_); }
  GridRange around(Coord c) const { return GridRange::around(size_, c); }

  // Adjacent cells holding a truthy value; c itself is never counted.
  unsigned sum_neighbors(Coord c) const {
    unsigned n = 0;
    for (Coord o : around(c)) {
      if (o != c && get(o)) n++;
    }
    return n;
  }

  unsigned count() const {
    return static_cast<unsigned>(std::count_if(data_.begin(), data_.end(), [](const T& v){ return static_cast<bool>(v); }));
  }

private:
  size_t position(Coord c) const { return static_cast<size_t>(c.row) * size_.col + c.col; }

  Coord size_;
  std::vector<T> data_;
};

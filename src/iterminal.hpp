#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, refresh, read event).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <optional>
#include <string>
#include "input.hpp"

struct TermSize { int rows; int cols; };

// Color pairs shared by the renderer and the backends. "Dark"/"Light" are
// the two squares of the checkerboard.
enum ColorPair : int {
  PAIR_DEFAULT = 0,
  PAIR_CLOSED_DARK = 1,
  PAIR_CLOSED_LIGHT,
  PAIR_OPENED_DARK,
  PAIR_OPENED_LIGHT,
  PAIR_FLAG_DARK,
  PAIR_FLAG_LIGHT,
  PAIR_MINE_DARK,
  PAIR_MINE_LIGHT,
  PAIR_COUNT_DARK,
  PAIR_COUNT_LIGHT,
  PAIR_STATUS,
  PAIR_STATUS_WON,
  PAIR_STATUS_LOST,
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // Blocks for the next event; nullopt when no more input will arrive.
  virtual std::optional<InputEvent> read_event() = 0;
};

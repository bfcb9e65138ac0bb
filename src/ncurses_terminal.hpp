#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  std::optional<InputEvent> read_event() override;

private:
  void init_palette();
};

// getch() failed because a signal interrupted the read; read_event retries.
// Any other ERR (closed input) ends the event stream.
bool read_interrupted(int ch, int err);

// Maps one ncurses mouse report to an InputEvent; false for reports the
// game has no use for (wheel, middle button).
bool translate_mouse(const MEVENT& me, InputEvent& out);

// Maps a getch() key code; control characters become letter + MOD_CTRL.
InputEvent translate_key(int ch);

#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Draws land in a character grid (plus the color pair of every cell); input
 * is a scripted queue of events, read_event returns nullopt once it is empty.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  std::optional<InputEvent> read_event() override;

  void push_event(const InputEvent& ev) { events_.push_back(ev); }
  std::string row_text(int row) const;
  std::string text_at(int row, int col, int len) const;
  int pair_at(int row, int col) const;
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, int pair);

  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<std::vector<int>> pairs_;
  std::deque<InputEvent> events_;
  int refreshes_ = 0;
};

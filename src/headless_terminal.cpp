#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols),
    screen_(rows, std::string(cols, ' ')),
    pairs_(rows, std::vector<int>(cols, PAIR_DEFAULT)) {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  for (int r = 0; r < rows_; ++r) clear_to_eol(r, 0);
}

void HeadlessTerminal::put(int row, int col, const std::string& text, int pair) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    screen_[row][c] = text[i];
    pairs_[row][c] = pair;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, PAIR_DEFAULT);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, color_pair_id);
}

void HeadlessTerminal::move_cursor(int, int) {}

void HeadlessTerminal::refresh() { refreshes_++; }

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_ || col >= cols_) return;
  if (col < 0) col = 0;
  put(row, col, std::string(cols_ - col, ' '), PAIR_DEFAULT);
}

std::optional<InputEvent> HeadlessTerminal::read_event() {
  if (events_.empty()) return std::nullopt;
  InputEvent ev = events_.front();
  events_.pop_front();
  return ev;
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s = screen_[row];
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

std::string HeadlessTerminal::text_at(int row, int col, int len) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return std::string();
  return screen_[row].substr(col, len);
}

int HeadlessTerminal::pair_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return PAIR_DEFAULT;
  return pairs_[row][col];
}

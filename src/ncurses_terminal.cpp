#include "ncurses_terminal.hpp"
#include <cerrno>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    init_palette();
  }
}

void NcursesTerminal::init_palette() {
  short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
  short closed_dark, closed_light, opened_dark, opened_light, blue, red, white, green;
  if (COLORS >= 256) {
    closed_dark = 41; closed_light = 48;
    opened_dark = 253; opened_light = 231;
    blue = 21; red = 196; white = 231; green = 46;
  } else {
    closed_dark = COLOR_GREEN; closed_light = COLOR_CYAN;
    opened_dark = COLOR_WHITE; opened_light = COLOR_WHITE;
    blue = COLOR_BLUE; red = COLOR_RED; white = COLOR_WHITE; green = COLOR_GREEN;
  }
  init_pair(PAIR_CLOSED_DARK, closed_dark, closed_dark);
  init_pair(PAIR_CLOSED_LIGHT, closed_light, closed_light);
  init_pair(PAIR_OPENED_DARK, opened_dark, opened_dark);
  init_pair(PAIR_OPENED_LIGHT, opened_light, opened_light);
  init_pair(PAIR_FLAG_DARK, red, closed_dark);
  init_pair(PAIR_FLAG_LIGHT, red, closed_light);
  init_pair(PAIR_MINE_DARK, red, opened_dark);
  init_pair(PAIR_MINE_LIGHT, red, opened_light);
  init_pair(PAIR_COUNT_DARK, blue, opened_dark);
  init_pair(PAIR_COUNT_LIGHT, blue, opened_light);
  init_pair(PAIR_STATUS, white, bg);
  init_pair(PAIR_STATUS_WON, green, bg);
  init_pair(PAIR_STATUS_LOST, red, bg);
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

std::optional<InputEvent> NcursesTerminal::read_event() {
  for (;;) {
    errno = 0;
    int ch = getch();
    if (read_interrupted(ch, errno)) continue;
    if (ch == ERR) return std::nullopt;
    if (ch != KEY_MOUSE) return translate_key(ch);
    MEVENT me;
    if (getmouse(&me) != OK) continue;
    InputEvent ev;
    if (translate_mouse(me, ev)) return ev;
  }
}

bool read_interrupted(int ch, int err) {
  return ch == ERR && err == EINTR;
}

bool translate_mouse(const MEVENT& me, InputEvent& out) {
  unsigned mods = MOD_NONE;
  if (me.bstate & BUTTON_SHIFT) mods |= MOD_SHIFT;
  if (me.bstate & BUTTON_CTRL) mods |= MOD_CTRL;
  if (me.bstate & BUTTON_ALT) mods |= MOD_ALT;
  if (me.bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED)) {
    out = InputEvent::pointer(PointerButton::Left, PointerKind::Down, me.y, me.x, mods);
  } else if (me.bstate & (BUTTON3_PRESSED | BUTTON3_CLICKED)) {
    out = InputEvent::pointer(PointerButton::Right, PointerKind::Down, me.y, me.x, mods);
  } else if (me.bstate & BUTTON1_RELEASED) {
    out = InputEvent::pointer(PointerButton::Left, PointerKind::Up, me.y, me.x, mods);
  } else if (me.bstate & BUTTON3_RELEASED) {
    out = InputEvent::pointer(PointerButton::Right, PointerKind::Up, me.y, me.x, mods);
  } else if (me.bstate & REPORT_MOUSE_POSITION) {
    out = InputEvent::pointer(PointerButton::Other, PointerKind::Drag, me.y, me.x, mods);
  } else {
    return false;
  }
  return true;
}

InputEvent translate_key(int ch) {
  if (ch >= 1 && ch <= 26) return InputEvent::key('a' + ch - 1, MOD_CTRL);
  return InputEvent::key(ch);
}

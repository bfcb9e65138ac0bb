#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  // presses and releases are reported separately, no click synthesis
  mouseinterval(0);
  mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  mousemask(0, nullptr);
  curs_set(1);
  endwin();
}

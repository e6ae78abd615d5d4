#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(1, COLOR_BLUE, -1); // link text
    } else {
      init_pair(1, COLOR_BLUE, COLOR_BLACK);
    }
    colors_ = true;
  }
}

Terminal::~Terminal() {
  endwin();
}

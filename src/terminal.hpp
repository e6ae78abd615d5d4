#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown for the page preview.
 * Usage: construct before showing pages; destructor restores the terminal.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
  bool colors() const { return colors_; }
private:
  bool colors_ = false;
};

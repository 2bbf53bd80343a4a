#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses screen init/teardown.
 * Usage: construct in main before any drawing; destructor restores the terminal on every exit path.
 * Note: manages terminal modes (raw/noecho/keypad/cursor), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  SCREEN* screen_ = nullptr;
};

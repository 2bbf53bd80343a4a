#include "terminal.hpp"
#include "types.hpp"
#include <locale.h>
#include <cstdio>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw TerminalError("can not initialize terminal (is TERM set?)");
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}

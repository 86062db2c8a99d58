#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>

namespace {
// ms to wait after ESC before treating it as a lone key rather than a sequence
constexpr int kEscDelayMs = 25;
}

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(kEscDelayMs);
  saved_cursor_ = curs_set(1);
}

Terminal::~Terminal() {
  if (saved_cursor_ != ERR) curs_set(saved_cursor_);
  echo();
  noraw();
  endwin();
}

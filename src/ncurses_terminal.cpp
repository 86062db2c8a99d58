#include "ncurses_terminal.hpp"
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) init_pair(1, -1, -1);
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

void NcursesTerminal::refresh() { ::refresh(); }

int NcursesTerminal::read_key() {
  int ch = getch();
  switch (ch) {
    case ERR: return KEY_CLOSED;
    case KEY_BACKSPACE: return 127;
    case KEY_ENTER: case '\r': return '\n';
    default: break;
  }
  // function keys, resize events etc. have no byte binding
  if (ch < 0 || ch > 255) return 0;
  return ch;
}

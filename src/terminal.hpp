#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores echo, cooked mode and the cursor shape.
 * Note: raw mode so Ctrl-C/Ctrl-Z/Ctrl-X reach the editor as bytes.
 */

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

private:
  int saved_cursor_ = -1;  // visibility before we forced it on; -1 if the terminal can't report it
};

#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple Editor from ncurses so it can be driven headless in tests.
 * Keys: read_key() yields bytes 0-255; KEY_CLOSED when input is gone.
 */
#include <string>

struct TermSize { int rows; int cols; };

inline constexpr int KEY_CLOSED = -1;

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual int read_key() = 0;
};

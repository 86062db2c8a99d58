#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests: a character grid plus a scripted key queue.
 * Input: read_key() drains the queue, then reports KEY_CLOSED.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows = 24, int cols = 80);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void clear_to_eol(int row, int col) override;
  void refresh() override { refreshes_++; }
  int read_key() override;

  void push_keys(const std::string& keys);
  void push_key(int ch) { keys_.push_back(ch); }
  // row text with trailing blanks stripped
  std::string row_text(int row) const;
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  int refresh_count() const { return refreshes_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::deque<int> keys_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
};

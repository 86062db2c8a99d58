#pragma once
/*
 * ActionLog
 *
 * Purpose: own the live buffer and its undo history; every edit goes through apply().
 * Undo: pop the last entry and rebuild by replaying History from the pristine copy.
 * Redo: re-commit the most recently undone entry with its original carried state.
 * Invariant: replaying pristine_ through history_ always yields live_.
 */
#include <functional>
#include <vector>
#include "types.hpp"
#include "action.hpp"
#include "text_buffer.hpp"

struct LogEntry {
  Action action;
  CarriedState carried;
};

class ActionLog {
public:
  using CarriedFn = std::function<CarriedState()>;

  ActionLog(TextBuffer start, CarriedFn carried);

  // cur receives the cursor the action leaves behind; NOOP leaves it alone.
  const TextBuffer& apply(const Action& action, Cursor& cur);
  const TextBuffer& apply(const Action& action);

  size_t history_size() const { return history_.size(); }
  size_t redo_size() const { return redo_.size(); }

private:
  bool commit(const LogEntry& e, Cursor& cur);
  void undo(Cursor& cur);
  void redo(Cursor& cur);
  void rebuild();

  TextBuffer pristine_;
  TextBuffer live_;
  CarriedFn carried_;
  std::vector<LogEntry> history_;
  std::vector<LogEntry> redo_;
};

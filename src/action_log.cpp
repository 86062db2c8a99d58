#include "action_log.hpp"

ActionLog::ActionLog(TextBuffer start, CarriedFn carried)
    : pristine_(start), live_(std::move(start)), carried_(std::move(carried)) {}

const TextBuffer& ActionLog::apply(const Action& action) {
  Cursor scratch;
  return apply(action, scratch);
}

const TextBuffer& ActionLog::apply(const Action& action, Cursor& cur) {
  switch (action.type) {
    case Action::Noop: break;
    case Action::Undo: undo(cur); break;
    case Action::Redo: redo(cur); break;
    default: {
      CarriedState at = carried_ ? carried_() : CarriedState{cur.row, cur.col};
      if (commit({action, at}, cur)) redo_.clear();
    } break;
  }
  return live_;
}

bool ActionLog::commit(const LogEntry& e, Cursor& cur) {
  Cursor post;
  bool changed = apply_edit(live_, e.action, e.carried, post);
  cur = post;
  if (changed) history_.push_back(e);
  return changed;
}

void ActionLog::undo(Cursor& cur) {
  if (history_.empty()) return;
  LogEntry e = history_.back();
  history_.pop_back();
  redo_.push_back(e);
  rebuild();
  cur = {e.carried.row, e.carried.col};
}

void ActionLog::redo(Cursor& cur) {
  if (redo_.empty()) return;
  LogEntry e = redo_.back();
  redo_.pop_back();
  commit(e, cur);
}

// TODO: replay from periodic checkpoints instead of pristine_ once histories get long
void ActionLog::rebuild() {
  live_ = pristine_;
  Cursor ignored;
  for (const LogEntry& e : history_) apply_edit(live_, e.action, e.carried, ignored);
}

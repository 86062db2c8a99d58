#pragma once
/*
 * Action
 *
 * Purpose: replayable buffer edits as small tagged commands (type + payload).
 * Replay: apply_edit is deterministic in (buffer, carried state), so History
 *         can be re-run against a pristine copy to rebuild any state.
 * Sentinels: Noop/Undo/Redo are control signals for ActionLog, never stored.
 */
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"
#include "text_buffer.hpp"

struct Action {
  enum Type { InsertChar, Newline, Backspace, Substitute, Noop, Undo, Redo } type;
  char ch = 0;
  std::string payload;      // Substitute: search text
  std::string alt_payload;  // Substitute: replacement text

  static Action insert_char(char c) { return {InsertChar, c, {}, {}}; }
  static Action newline() { return {Newline, 0, {}, {}}; }
  static Action backspace() { return {Backspace, 0, {}, {}}; }
  static Action substitute(std::string search, std::string replace) {
    return {Substitute, 0, std::move(search), std::move(replace)};
  }
  static Action noop() { return {Noop, 0, {}, {}}; }
  static Action undo() { return {Undo, 0, {}, {}}; }
  static Action redo() { return {Redo, 0, {}, {}}; }
};

/*
 * Execute a mutating action at `at` against `buf`.
 * post receives the cursor the edit leaves behind.
 * Returns true when the buffer changed. Sentinels never change anything.
 */
bool apply_edit(TextBuffer& buf, const Action& action, const CarriedState& at, Cursor& post);

// Literal (non-regex) needle, preprocessed once and reusable across lines.
class LiteralPattern {
public:
  explicit LiteralPattern(std::string needle);
  // offset of the first occurrence at or after from, or npos
  size_t find(const std::string& hay, size_t from = 0) const;
  size_t size() const { return needle_.size(); }
  bool empty() const { return needle_.empty(); }

private:
  std::string needle_;
  std::vector<int> shift_;  // where to resume after a mismatch at needle_[k]; -1 steps past the text byte
};

/* replace every non-overlapping occurrence of pat in s, left to right; returns the count */
int replace_all(std::string& s, const std::string& pat, const std::string& rep);

/* first occurrence of pat in s at or after start, or -1 */
int find_first_from(const std::string& s, const std::string& pat, size_t start);

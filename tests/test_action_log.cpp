#include "action_log.hpp"
#include <cassert>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

/* an ActionLog whose carried state is the harness cursor, as the editor wires it */
struct Harness {
  Cursor cur;
  ActionLog log;
  explicit Harness(Lines start = {""})
      : log(TextBuffer(std::move(start)), [this]{ return CarriedState{cur.row, cur.col}; }) {}
  const TextBuffer& apply(const Action& a) { return log.apply(a, cur); }
  void type(const std::string& s) {
    for (char c : s) apply(c == '\n' ? Action::newline() : Action::insert_char(c));
  }
  Lines lines() { return log.apply(Action::noop()).lines(); }
};

static void test_scenario_type_and_undo() {
  Harness h;
  h.type("ab\ncd");
  assert((h.lines() == Lines{"ab", "cd"}));
  assert((h.cur == Cursor{1, 2}));
  h.apply(Action::undo());
  assert((h.lines() == Lines{"ab", "c"}));
  assert((h.cur == Cursor{1, 1}));
}

static void test_undo_all_then_redo_all() {
  Harness h;
  h.type("ab\ncd");
  Lines after = h.lines();
  Cursor post = h.cur;
  size_t n = h.log.history_size();
  assert(n == 5);
  for (size_t i = 0; i < n; ++i) h.apply(Action::undo());
  assert((h.lines() == Lines{""}));
  assert((h.cur == Cursor{0, 0}));
  assert(h.log.redo_size() == n);
  for (size_t i = 0; i < n; ++i) h.apply(Action::redo());
  assert(h.lines() == after);
  assert(h.cur == post);
  assert(h.log.redo_size() == 0);
}

static void test_new_commit_discards_redo() {
  Harness h;
  h.type("ab");
  h.apply(Action::undo());
  assert(h.log.redo_size() == 1);
  h.type("x");
  assert(h.log.redo_size() == 0);
  h.apply(Action::redo());
  assert((h.lines() == Lines{"ax"}));
  assert((h.cur == Cursor{0, 2}));
}

static void test_noop_and_empty_stacks() {
  Harness h(Lines{"keep", "me"});
  h.apply(Action::undo());
  h.apply(Action::redo());
  assert(h.log.history_size() == 0 && h.log.redo_size() == 0);
  h.type("z");
  h.apply(Action::undo());
  size_t hist = h.log.history_size(), redo = h.log.redo_size();
  Cursor before = h.cur;
  const TextBuffer& b = h.log.apply(Action::noop(), h.cur);
  assert((b.lines() == Lines{"keep", "me"}));
  assert(h.log.history_size() == hist && h.log.redo_size() == redo);
  assert(h.cur == before);
}

static void test_carried_state_not_live_cursor() {
  Harness h(Lines{"abc"});
  h.cur = {0, 1};
  h.apply(Action::insert_char('X'));
  h.cur = {0, 4};
  h.apply(Action::insert_char('Y'));
  assert((h.lines() == Lines{"aXbcY"}));
  // cursor drifts elsewhere; undo replays X at its original column
  h.cur = {0, 0};
  h.apply(Action::undo());
  assert((h.lines() == Lines{"aXbc"}));
  assert((h.cur == Cursor{0, 4}));
  h.apply(Action::redo());
  assert((h.lines() == Lines{"aXbcY"}));
}

static void test_backspace() {
  Harness h(Lines{"ab", "cd"});
  h.cur = {0, 0};
  h.apply(Action::backspace());
  assert((h.lines() == Lines{"ab", "cd"}));
  assert(h.log.history_size() == 0);
  h.cur = {1, 0};
  h.apply(Action::backspace());
  assert((h.lines() == Lines{"abcd"}));
  assert((h.cur == Cursor{0, 2}));
  h.apply(Action::backspace());
  assert((h.lines() == Lines{"acd"}));
  assert((h.cur == Cursor{0, 1}));
  h.apply(Action::undo());
  h.apply(Action::undo());
  assert((h.lines() == Lines{"ab", "cd"}));
  assert((h.cur == Cursor{1, 0}));
}

static void test_newline_splits_mid_line() {
  Harness h(Lines{"hello"});
  h.cur = {0, 2};
  h.apply(Action::newline());
  assert((h.lines() == Lines{"he", "llo"}));
  assert((h.cur == Cursor{1, 0}));
}

static void test_substitute_all_per_line() {
  Harness h(Lines{"ab", "cab", "abxab"});
  h.cur = {1, 3};
  h.apply(Action::substitute("ab", "y"));
  assert((h.lines() == Lines{"y", "cy", "yxy"}));
  assert((h.cur == Cursor{1, 2}));
  h.apply(Action::undo());
  assert((h.lines() == Lines{"ab", "cab", "abxab"}));
  assert((h.cur == Cursor{1, 3}));
}

static void test_substitute_without_match_is_not_committed() {
  Harness h(Lines{"abc"});
  h.type("d");
  h.apply(Action::undo());
  h.apply(Action::substitute("zz", "y"));
  assert(h.log.history_size() == 0);
  assert(h.log.redo_size() == 1);
}

static void test_replace_all_helper() {
  std::string s = "aaaa";
  assert(replace_all(s, "aa", "b") == 2);
  assert(s == "bb");
  std::string t = "abc";
  assert(replace_all(t, "", "x") == 0);
  assert(t == "abc");
  assert(find_first_from("xxabab", "ab", 0) == 2);
  assert(find_first_from("xxabab", "ab", 3) == 4);
  assert(find_first_from("xxabab", "q", 0) == -1);
}

static void test_literal_pattern_backtracks() {
  LiteralPattern p("aaab");
  assert(p.find("aabaabaaab") == 6);
  assert(p.find("aaaaaaab") == 4);
  assert(p.find("aaaa") == std::string::npos);
  LiteralPattern q("abab");
  assert(q.find("abacababab") == 4);
  assert(q.find("abacababab", 5) == 6);
  assert(LiteralPattern("").find("abc") == std::string::npos);
  std::string s = "a.b.c";
  assert(replace_all(s, ".", "..") == 2);
  assert(s == "a..b..c");
}

int main() {
  test_scenario_type_and_undo();
  test_undo_all_then_redo_all();
  test_new_commit_discards_redo();
  test_noop_and_empty_stacks();
  test_carried_state_not_live_cursor();
  test_backspace();
  test_newline_splits_mid_line();
  test_substitute_all_per_line();
  test_substitute_without_match_is_not_committed();
  test_replace_all_helper();
  test_literal_pattern_backtracks();
  return 0;
}

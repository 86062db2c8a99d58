#include "action.hpp"
#include <algorithm>
#include <utility>

LiteralPattern::LiteralPattern(std::string needle) : needle_(std::move(needle)), shift_(needle_.size() + 1, -1) {
  int k = -1;
  for (size_t i = 0; i < needle_.size(); ) {
    while (k >= 0 && needle_[i] != needle_[(size_t)k]) k = shift_[(size_t)k];
    ++i; ++k;
    shift_[i] = (i < needle_.size() && needle_[i] == needle_[(size_t)k]) ? shift_[(size_t)k] : k;
  }
}

size_t LiteralPattern::find(const std::string& hay, size_t from) const {
  if (needle_.empty()) return std::string::npos;
  int k = 0;
  for (size_t i = from; i < hay.size(); ++i) {
    while (k >= 0 && hay[i] != needle_[(size_t)k]) k = shift_[(size_t)k];
    if (++k == (int)needle_.size()) return i + 1 - needle_.size();
  }
  return std::string::npos;
}

int find_first_from(const std::string& s, const std::string& pat, size_t start) {
  size_t pos = LiteralPattern(pat).find(s, start);
  return pos == std::string::npos ? -1 : (int)pos;
}

int replace_all(std::string& s, const std::string& pat, const std::string& rep) {
  LiteralPattern needle(pat);
  if (needle.empty()) return 0;
  std::string out;
  size_t from = 0;
  int count = 0;
  for (size_t pos; (pos = needle.find(s, from)) != std::string::npos; ++count) {
    out.append(s, from, pos - from);
    out += rep;
    from = pos + needle.size();
  }
  if (count == 0) return 0;
  out.append(s, from, std::string::npos);
  s = std::move(out);
  return count;
}

bool apply_edit(TextBuffer& buf, const Action& action, const CarriedState& at, Cursor& post) {
  int row = std::clamp(at.row, 0, buf.line_count() - 1);
  std::string s = buf.line(row);
  int col = std::clamp(at.col, 0, (int)s.size());
  post = {row, col};
  switch (action.type) {
    case Action::InsertChar: {
      s.insert(s.begin() + col, action.ch);
      buf.replace_line(row, s);
      post = {row, col + 1};
      return true;
    }
    case Action::Newline: {
      buf.replace_line(row, s.substr(0, col));
      buf.insert_line(row + 1, s.substr(col));
      post = {row + 1, 0};
      return true;
    }
    case Action::Backspace: {
      if (col > 0 && !s.empty()) {
        s.erase(s.begin() + col - 1);
        buf.replace_line(row, s);
        post = {row, col - 1};
        return true;
      }
      if (col == 0 && row > 0) {
        std::string prev = buf.line(row - 1);
        int join_col = (int)prev.size();
        buf.replace_line(row - 1, prev + s);
        buf.erase_line(row);
        post = {row - 1, join_col};
        return true;
      }
      return false;
    }
    case Action::Substitute: {
      bool changed = false;
      for (int r = 0; r < buf.line_count(); ++r) {
        std::string t = buf.line(r);
        if (replace_all(t, action.payload, action.alt_payload) > 0 && t != buf.line(r)) {
          buf.replace_line(r, t);
          changed = true;
        }
      }
      post = {row, std::min(col, (int)buf.line(row).size())};
      return changed;
    }
    case Action::Noop:
    case Action::Undo:
    case Action::Redo:
      break;
  }
  return false;
}

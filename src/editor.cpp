#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include "config.hpp"
#include "file_reader.hpp"

Editor::Editor(ITerminal& term, const std::optional<std::filesystem::path>& file) : term(term) {
  st.mode = VIBE_INITIAL_MODE_VALUE;
  TextBuffer start;
  if (file) {
    std::error_code ec;
    st.file_path = *file;
    if (std::filesystem::exists(*file, ec)) {
      bool ok = true; std::string m;
      start = TextBuffer::from_file(*file, m, ok);
      if (ok) st.message = m; else notify(m);
    } else {
      st.message = std::string("new file: ") + file->string();
    }
  }
  reset_document(std::move(start));
  bind_keys();
  register_commands();
  load_rc();
}

void Editor::reset_document(TextBuffer buf) {
  doc = std::make_unique<ActionLog>(std::move(buf), [this]{
    return CarriedState{st.cur.row, st.cur.col};
  });
  st.cur = {0, 0};
  vp = Viewport{};
  mark_clean();
}

void Editor::mark_clean() {
  clean_len = doc->history_size();
  st.modified = false;
}

const TextBuffer& Editor::buffer() { return doc->apply(Action::noop()); }

void Editor::run() {
  while (!st.should_quit) {
    render();
    int ch = term.read_key();
    if (ch == KEY_CLOSED) break;
    handle_key(ch);
  }
}

void Editor::render() {
  RenderInfo info;
  info.buf = &buffer();
  info.cur = st.cur;
  info.mode = st.mode;
  info.file_path = st.file_path;
  info.modified = st.modified;
  info.message = st.message;
  info.cmdline = st.cmdline;
  info.notice = st.notice;
  if (st.debug) {
    info.debug_line = "hist:" + std::to_string(doc->history_size()) +
                      " redo:" + std::to_string(doc->redo_size()) +
                      " key:" + std::to_string(st.last_key);
  }
  renderer.render(term, info, vp);
}

void Editor::handle_key(int ch) {
  st.last_key = ch;
  if (ch == keys::CTRL_C) { st.should_quit = true; return; }
  if (!st.notice.empty()) { st.notice.clear(); return; }
  Mode mode = st.mode;
  size_t hist = doc->history_size(), redo = doc->redo_size();
  std::string message = std::move(st.message);
  st.message.clear();
  keymap.dispatch(st.mode, ch);
  // a status message lasts until the mode or the buffer moves on
  bool moved_on = st.mode != mode || doc->history_size() != hist || doc->redo_size() != redo;
  if (!moved_on && st.message.empty()) st.message = std::move(message);
}

void Editor::notify(const std::string& text) { st.notice = text; }

void Editor::bind_keys() {
  for (int ch = 0; ch < KeyTable::kKeyCount; ++ch) {
    if (!keys::is_text(ch)) continue;
    char c = static_cast<char>(ch);
    keymap.bind(Mode::Insert, ch, [this, c]{ submit(Action::insert_char(c)); });
    keymap.bind(Mode::Command, ch, [this, c]{ cmd_append(c); });
  }
  auto undo = [this]{ submit(Action::undo()); };
  auto redo = [this]{ submit(Action::redo()); };

  keymap.bind(Mode::Insert, keys::NL, [this]{ submit(Action::newline()); });
  keymap.bind(Mode::Insert, keys::DEL, [this]{ submit(Action::backspace()); });
  keymap.bind(Mode::Insert, keys::BS, [this]{ submit(Action::backspace()); });
  keymap.bind(Mode::Insert, keys::ESC, [this]{ enter_mode(Mode::Normal); });
  keymap.bind(Mode::Insert, keys::CTRL_Z, undo);
  keymap.bind(Mode::Insert, keys::CTRL_X, redo);

  keymap.bind(Mode::Normal, 'h', [this]{ move_cursor(-1, 0); });
  keymap.bind(Mode::Normal, 'l', [this]{ move_cursor(1, 0); });
  keymap.bind(Mode::Normal, 'j', [this]{ move_cursor(0, 1); });
  keymap.bind(Mode::Normal, 'k', [this]{ move_cursor(0, -1); });
  keymap.bind(Mode::Normal, 'i', [this]{ enter_mode(Mode::Insert); });
  keymap.bind(Mode::Normal, ':', [this]{ enter_mode(Mode::Command); });
  keymap.bind(Mode::Normal, keys::CTRL_Z, undo);
  keymap.bind(Mode::Normal, keys::CTRL_X, redo);

  keymap.bind(Mode::Command, keys::ESC, [this]{ cmd_cancel(); });
  keymap.bind(Mode::Command, keys::NL, [this]{ cmd_submit(); });
  keymap.bind(Mode::Command, keys::DEL, [this]{ cmd_backspace(); });
  keymap.bind(Mode::Command, keys::BS, [this]{ cmd_backspace(); });
}

void Editor::submit(const Action& action) {
  size_t hist = doc->history_size();
  doc->apply(action, st.cur);
  bool committed = action.type != Action::Undo && action.type != Action::Redo &&
                   doc->history_size() != hist;
  if (committed && hist < clean_len) clean_len = std::string::npos;
  st.modified = doc->history_size() != clean_len;
}

void Editor::move_cursor(int dcol, int drow) {
  const TextBuffer& b = doc->apply(Action::noop());
  int row = std::clamp(st.cur.row + drow, 0, b.line_count() - 1);
  int col = std::clamp(st.cur.col + dcol, 0, (int)b.line(row).size());
  st.cur = {row, col};
}

void Editor::enter_mode(Mode m) {
  if (m == Mode::Command) st.cmdline.clear();
  st.mode = m;
}

void Editor::cmd_append(char c) { st.cmdline.push_back(c); }

void Editor::cmd_backspace() {
  if (!st.cmdline.empty()) st.cmdline.pop_back();
}

void Editor::cmd_cancel() {
  st.cmdline.clear();
  st.mode = Mode::Normal;
}

void Editor::cmd_submit() {
  std::string line = st.cmdline;
  st.cmdline.clear();
  execute_command(line);
  st.mode = Mode::Normal;
}

// unknown commands are dropped without feedback
bool Editor::execute_command(const std::string& line) {
  return registry.execute(line);
}

static std::string trim(const std::string& s) {
  auto blank = [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), blank);
  auto e = std::find_if_not(s.rbegin(), std::string::const_reverse_iterator(b), blank).base();
  return std::string(b, e);
}

// one command per line, leading ':' optional; '#' and '"' start comment lines
void Editor::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  std::error_code ec;
  auto p = std::filesystem::path(home) / VIBE_RC_NAME;
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!read_lines(p, lines, msg)) { notify(msg); return; }
  for (const std::string& raw : lines) {
    std::string cmd = trim(raw);
    if (cmd.empty() || cmd[0] == '#' || cmd[0] == '"') continue;
    execute_command(cmd[0] == ':' ? cmd.substr(1) : cmd);
  }
}

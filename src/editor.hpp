#pragma once
#include <optional>
#include <filesystem>
#include <memory>
#include <string>
#include "types.hpp"
#include "text_buffer.hpp"
#include "action_log.hpp"
#include "keymap.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "cmd_registry.hpp"

/* everything keystroke handlers read or write besides the buffer itself */
struct EditorState {
  Mode mode = Mode::Insert;
  Cursor cur;
  std::string cmdline;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  bool debug = false;
  bool should_quit = false;
  int last_key = -1;
  std::string message;
  std::string notice;  // blocking: the next key acknowledges it
};

class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file);
  void run();
  void handle_key(int ch);

  const EditorState& state() const { return st; }
  const TextBuffer& buffer();
  const ActionLog& log() const { return *doc; }
  bool execute_command(const std::string& line);

private:
  ITerminal& term;
  EditorState st;
  std::unique_ptr<ActionLog> doc;
  KeyTable keymap;
  CommandRegistry registry;
  Renderer renderer;
  Viewport vp;
  // history length that matches the file on disk; npos once that state is unreachable
  size_t clean_len = 0;

  void reset_document(TextBuffer buf);
  void render();
  void bind_keys();
  void register_commands();
  void load_rc();
  void notify(const std::string& text);

  void submit(const Action& action);
  void mark_clean();
  void move_cursor(int dcol, int drow);
  void enter_mode(Mode m);
  void cmd_append(char c);
  void cmd_backspace();
  void cmd_submit();
  void cmd_cancel();

  void write_to(const std::string& args);
  void open_file(const std::string& args);
  void search(const std::string& pattern);
  void substitute(const std::string& args);
};

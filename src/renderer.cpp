#include "renderer.hpp"
#include <sstream>
#include <algorithm>
#include "config.hpp"

const char* mode_name(Mode mode) {
  switch (mode) {
    case Mode::Insert: return "INSERT";
    case Mode::Normal: return "NORMAL";
    case Mode::Command: return "COMMAND";
  }
  return "?";
}

static void render_welcome(ITerminal& term, int rows, int cols) {
  const char* art[] = {
    "V     V   III   BBBB    EEEEE",
    " V   V     I    B   B   E    ",
    "  V V      I    BBBB    EEE  ",
    "   V      III   BBBB    EEEEE",
    "",
    VIBE_BANNER
  };
  int lines = 6;
  int max_text_rows = std::max(0, rows - 1);
  int start_row = std::max(0, (max_text_rows - lines) / 2);
  for (int i = 0; i < lines && start_row + i < max_text_rows; i++) {
    std::string s(art[i]);
    int start_col = std::max(0, (cols - (int)s.size()) / 2);
    term.draw_text(start_row + i, start_col, s);
  }
}

std::string Renderer::status_text(const RenderInfo& info) {
  if (info.mode == Mode::Command && info.notice.empty()) return ":" + info.cmdline;
  std::ostringstream oss;
  oss << mode_name(info.mode) << "  "
      << (info.file_path ? info.file_path->string() : "[no file]")
      << (info.modified ? " [+]" : "")
      << "  line:" << info.cur.row << " col:" << info.cur.col;
  if (!info.debug_line.empty()) oss << "  " << info.debug_line;
  if (!info.notice.empty()) oss << "  " << info.notice << "  [press any key]";
  else if (!info.message.empty()) oss << "  | " << info.message;
  return oss.str();
}

void Renderer::render(ITerminal& term, const RenderInfo& info, Viewport& vp) {
  const TextBuffer& buf = *info.buf;
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(1, rows - 1);
  const Cursor& cur = info.cur;
  if (cur.row < vp.top_line) vp.top_line = cur.row;
  if (cur.row >= vp.top_line + max_text_rows) vp.top_line = cur.row - max_text_rows + 1;

  bool show_welcome = (!info.file_path && buf.line_count() == 1 && buf.line(0).empty());
  if (show_welcome) {
    render_welcome(term, rows, cols);
  } else {
    for (int i = 0; i < max_text_rows; ++i) {
      int line_idx = vp.top_line + i;
      if (line_idx >= buf.line_count()) break;
      const std::string& s = buf.line(line_idx);
      std::string vis = s.substr(0, std::min(s.size(), (size_t)std::max(0, cols)));
      term.draw_text(i, 0, vis);
      term.clear_to_eol(i, (int)vis.size());
    }
  }

  std::string status = status_text(info);
  if ((int)status.size() > cols) status.resize((size_t)std::max(0, cols));
  term.draw_text(rows - 1, 0, status);
  term.clear_to_eol(rows - 1, (int)status.size());

  if (!info.notice.empty() || info.mode == Mode::Command) {
    term.move_cursor(rows - 1, std::min((int)status.size(), std::max(0, cols - 1)));
  } else {
    int screen_row = cur.row - vp.top_line;
    int screen_col = std::min(cur.col, std::max(0, cols - 1));
    term.move_cursor(screen_row, screen_col);
  }
  term.refresh();
}

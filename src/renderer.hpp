#pragma once
/*
 * Renderer
 *
 * Purpose: draw visible lines and the status line; keep the cursor row in view.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Editor to render.
 */
#include <string>
#include <optional>
#include <filesystem>
#include "text_buffer.hpp"
#include "types.hpp"
#include "iterminal.hpp"

struct RenderInfo {
  const TextBuffer* buf = nullptr;
  Cursor cur{};
  Mode mode = Mode::Insert;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  std::string message;
  std::string cmdline;
  std::string notice;
  std::string debug_line;  // empty unless :debug is on
};

class Renderer {
public:
  void render(ITerminal& term, const RenderInfo& info, Viewport& vp);
  static std::string status_text(const RenderInfo& info);
};

const char* mode_name(Mode mode);

#include "editor.hpp"
#include <cctype>
#include <string>
#include <filesystem>

// args of the form " <filename>": at least one leading blank, then a name
static bool parse_filename(const std::string& args, std::string& out) {
  if (args.empty() || !std::isspace(static_cast<unsigned char>(args[0]))) return false;
  size_t i = args.find_first_not_of(" \t");
  if (i == std::string::npos) return false;
  size_t j = args.find_last_not_of(" \t");
  out = args.substr(i, j - i + 1);
  return true;
}

void Editor::register_commands() {
  registry.register_command("q", [this](const std::string&){ st.should_quit = true; });
  registry.register_command("w", [this](const std::string& args){ write_to(args); });
  registry.register_command("f", [this](const std::string& args){ open_file(args); });
  registry.register_command("file", [this](const std::string& args){ open_file(args); });
  registry.register_command("debug", [this](const std::string&){
    st.debug = !st.debug;
    st.message = st.debug ? "debug on" : "debug off";
  });
  registry.register_command("/", [this](const std::string& args){ search(args); });
  registry.register_command("s", [this](const std::string& args){ substitute(args); });
}

void Editor::write_to(const std::string& args) {
  std::string name;
  if (!parse_filename(args, name)) { notify("don't have path, use :w <path>"); return; }
  std::string mm;
  if (!buffer().write_file(name, mm)) { notify(mm); return; }
  mark_clean();
  if (!st.file_path) st.file_path = std::filesystem::path(name);
  st.message = mm;
}

void Editor::open_file(const std::string& args) {
  std::string name;
  if (!parse_filename(args, name)) { notify("don't have path, use :f <path>"); return; }
  std::filesystem::path p(name);
  bool ok = true; std::string mm;
  TextBuffer loaded = TextBuffer::from_file(p, mm, ok);
  if (!ok) { notify(mm); return; }
  reset_document(std::move(loaded));
  st.file_path = p;
  st.message = mm;
}

void Editor::search(const std::string& pattern) {
  if (pattern.empty()) { notify("pattern empty"); return; }
  const TextBuffer& b = buffer();
  for (int r = 0; r < b.line_count(); ++r) {
    int pos = find_first_from(b.line(r), pattern, 0);
    if (pos >= 0) { st.cur = {r, pos}; return; }
  }
  notify("not found pattern: " + pattern);
}

void Editor::substitute(const std::string& args) {
  const char* usage = "bad substitute, use :s/search/replace";
  if (args.empty() || args[0] != '/') { notify(usage); return; }
  std::string rest = args.substr(1);
  size_t sep = rest.find('/');
  if (sep == std::string::npos) { notify(usage); return; }
  std::string pat = rest.substr(0, sep);
  std::string rep = rest.substr(sep + 1);
  if (!rep.empty() && rep.back() == '/') rep.pop_back();
  if (pat.empty()) { notify(usage); return; }
  size_t before = doc->history_size();
  submit(Action::substitute(pat, rep));
  if (doc->history_size() == before) notify("not found pattern: " + pat);
}

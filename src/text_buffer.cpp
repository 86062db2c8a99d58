#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include "posix_fd.hpp"
#include "file_reader.hpp"
#include "config.hpp"

TextBuffer::TextBuffer() { ensure_not_empty(); }

TextBuffer::TextBuffer(std::vector<std::string> lines) : lines_(std::move(lines)) {
  ensure_not_empty();
}

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

const std::string& TextBuffer::line(int r) const {
  static const std::string empty;
  if (r < 0 || r >= line_count()) return empty;
  return lines_[static_cast<size_t>(r)];
}

void TextBuffer::insert_line(int row, const std::string& s) {
  size_t pos = static_cast<size_t>(std::max(0, std::min(row, line_count())));
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), s);
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  std::vector<std::string> ls;
  ok = read_lines(path, ls, msg);
  if (!ok) return TextBuffer();
  return TextBuffer(std::move(ls));
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  UniqueFd ufd(::open(path.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + path.string();
    return false;
  }
  std::vector<char> buf(static_cast<size_t>(VIBE_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto write_span = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(ufd.get(), p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        msg = std::string("write file failed: ") + path.string();
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  auto flush_buf = [&]() -> bool {
    bool good = write_span(buf.data(), used);
    used = 0;
    return good;
  };
  int n = line_count();
  for (int i = 0; i < n; ++i) {
    const std::string& s = lines_[static_cast<size_t>(i)];
    bool need_nl = (i + 1 < n);
    size_t need = s.size() + (need_nl ? 1u : 0u);
    if (need > buf.size() - used) {
      if (used > 0 && !flush_buf()) return false;
      if (need > buf.size()) {
        if (!write_span(s.data(), s.size())) return false;
        if (need_nl && !write_span("\n", 1)) return false;
        continue;
      }
    }
    std::memcpy(buf.data() + used, s.data(), s.size());
    used += s.size();
    if (need_nl) buf[used++] = '\n';
  }
  if (used > 0 && !flush_buf()) return false;
  if (!ufd.close()) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}

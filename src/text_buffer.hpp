#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer supporting line ops and file I/O.
 * Invariant: never empty; an empty buffer holds a single "" line.
 * Note: writes are a plain O_TRUNC overwrite (no temp file, no fsync).
 */
#include <string>
#include <vector>
#include <filesystem>

class TextBuffer {
public:
  TextBuffer();
  explicit TextBuffer(std::vector<std::string> lines);

  int line_count() const { return static_cast<int>(lines_.size()); }
  const std::string& line(int r) const;
  const std::vector<std::string>& lines() const { return lines_; }

  void insert_line(int row, const std::string& s);
  void erase_line(int row);
  void replace_line(int row, const std::string& s);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

  friend bool operator==(const TextBuffer& a, const TextBuffer& b) { return a.lines_ == b.lines_; }
  friend bool operator!=(const TextBuffer& a, const TextBuffer& b) { return !(a == b); }

private:
  void ensure_not_empty();
  std::vector<std::string> lines_;
};

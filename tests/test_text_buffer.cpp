#include "text_buffer.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

static std::filesystem::path scratch_dir() {
  auto d = std::filesystem::temp_directory_path() / ("vibe_tb_" + std::to_string(::getpid()));
  std::filesystem::create_directories(d);
  return d;
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static void spit(const std::filesystem::path& p, const std::string& s) {
  std::ofstream out(p, std::ios::binary);
  out << s;
}

static void test_line_ops() {
  TextBuffer b(std::vector<std::string>{"a", "b", "c"});
  assert(b.line_count() == 3);
  b.insert_line(1, "x");
  assert(b.line_count() == 4);
  assert(b.line(1) == std::string("x"));
  b.erase_line(2);
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.line(1) == std::string("x"));
  assert(b.line(2) == std::string("c"));
  b.replace_line(2, "z");
  assert(b.line(2) == std::string("z"));
  assert(b.line(7).empty());
  assert(b.line(-1).empty());
}

static void test_never_empty() {
  TextBuffer e;
  assert(e.line_count() == 1);
  assert(e.line(0).empty());
  TextBuffer v(std::vector<std::string>{});
  assert(v.line_count() == 1);
  TextBuffer one(std::vector<std::string>{"only"});
  one.erase_line(0);
  assert(one.line_count() == 1);
  assert(one.line(0).empty());
}

static void test_split_lines() {
  std::vector<std::string> out;
  std::string s = "ab\r\ncd\nef";
  split_lines(s.data(), s.size(), out);
  assert((out == std::vector<std::string>{"ab\r", "cd", "ef"}));
  out.clear();
  split_lines("ab\r", 3, out);
  assert((out == std::vector<std::string>{"ab\r"}));
  out.clear();
  split_lines("", 0, out);
  assert((out == std::vector<std::string>{""}));
  out.clear();
  std::string t = "x\n";
  split_lines(t.data(), t.size(), out);
  assert((out == std::vector<std::string>{"x", ""}));
}

static void test_file_io() {
  auto dir = scratch_dir();
  auto p = dir / "in.txt";
  spit(p, "one\ntwo\nthree");
  bool ok = false; std::string msg;
  TextBuffer b = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(b.line_count() == 3);
  assert(b.line(2) == "three");
  assert(msg.find("opened file") == 0);

  auto empty = dir / "empty.txt";
  spit(empty, "");
  TextBuffer e = TextBuffer::from_file(empty, msg, ok);
  assert(ok);
  assert(e.line_count() == 1 && e.line(0).empty());

  TextBuffer missing = TextBuffer::from_file(dir / "nope.txt", msg, ok);
  assert(!ok);
  assert(msg.find("can not open file") == 0);
  assert(missing.line_count() == 1);

  TextBuffer out(std::vector<std::string>{"ab", "", "cd"});
  auto q = dir / "out.txt";
  spit(q, "old contents that are longer than the new ones");
  assert(out.write_file(q, msg));
  assert(slurp(q) == "ab\n\ncd");
  assert(msg.find("saved file") == 0);

  assert(!out.write_file(dir / "no_such_dir" / "x.txt", msg));
  assert(msg.find("write file failed") == 0);

  std::filesystem::remove_all(dir);
}

static void test_crlf_round_trip() {
  auto dir = scratch_dir();
  for (const std::string& text : {std::string("a\r\nb\r\n"), std::string("ab\r"), std::string("\r\n\r")}) {
    auto in = dir / "crlf_in.txt";
    auto out = dir / "crlf_out.txt";
    spit(in, text);
    bool ok = false; std::string msg;
    TextBuffer b = TextBuffer::from_file(in, msg, ok);
    assert(ok);
    assert(b.write_file(out, msg));
    assert(slurp(out) == text);
  }
  std::filesystem::remove_all(dir);
}

static void test_large_line_write() {
  auto dir = scratch_dir();
  std::string big(200 * 1024, 'q');
  TextBuffer b(std::vector<std::string>{"head", big, "tail"});
  std::string msg;
  auto p = dir / "big.txt";
  assert(b.write_file(p, msg));
  assert(slurp(p) == "head\n" + big + "\ntail");
  std::filesystem::remove_all(dir);
}

int main() {
  test_line_ops();
  test_never_empty();
  test_split_lines();
  test_file_io();
  test_crlf_round_trip();
  test_large_line_write();
  return 0;
}

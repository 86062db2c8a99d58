#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

void split_lines(const char* data, size_t n, std::vector<std::string>& out_lines) {
  const char* p = data;
  const char* last = data + n;
  while (true) {
    const char* nl = static_cast<const char*>(std::memchr(p, '\n', static_cast<size_t>(last - p)));
    if (!nl) break;
    out_lines.emplace_back(p, nl);
    p = nl + 1;
  }
  out_lines.emplace_back(p, last);
}

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }

  std::string data;
  data.reserve(static_cast<size_t>(st.st_size));
  char chunk[8192];
  while (true) {
    ssize_t r = ::read(fd.get(), chunk, sizeof(chunk));
    if (r < 0) {
      if (errno == EINTR) continue;
      msg = std::string("can not read file: ") + path.string();
      return false;
    }
    if (r == 0) break;
    data.append(chunk, static_cast<size_t>(r));
  }
  split_lines(data.data(), data.size(), out_lines);
  msg = std::string("opened file: ") + path.string();
  return true;
}

#include "cmd_registry.hpp"
#include <cctype>

static bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

std::string CommandRegistry::match(const std::string& line, std::string* args) const {
  for (size_t len = 1; len <= line.size(); ++len) {
    std::string name = line.substr(0, len);
    if (map_.find(name) == map_.end()) continue;
    if (len < line.size() && is_word_char(name.back()) && is_word_char(line[len])) continue;
    if (args) *args = line.substr(len);
    return name;
  }
  return std::string();
}

bool CommandRegistry::execute(const std::string& line) const {
  std::string args;
  std::string name = match(line, &args);
  if (name.empty()) return false;
  map_.at(name)(args);
  return true;
}

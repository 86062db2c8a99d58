#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands by prefix.
 * Resolve: scan prefixes of the submitted line from length 1 upward and run the
 *          first registered name equal to the prefix, passing the rest verbatim.
 *          A name ending in a letter or digit only matches at a word boundary,
 *          so "file x" reaches "file" rather than "f" with "ile x".
 */
#include <string>
#include <unordered_map>
#include <functional>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::string& args)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  // returns the resolved name, or "" when nothing matched
  std::string match(const std::string& line, std::string* args = nullptr) const;
  bool execute(const std::string& line) const;
private:
  std::unordered_map<std::string, Handler> map_;
};

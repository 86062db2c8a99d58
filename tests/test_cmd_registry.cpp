#include "cmd_registry.hpp"
#include <cassert>
#include <initializer_list>
#include <string>
#include <vector>

struct Call { std::string name; std::string args; };

static CommandRegistry make(std::vector<Call>& calls) {
  CommandRegistry r;
  for (const char* n : {"q", "w", "f", "file", "debug", "/", "s"}) {
    std::string name = n;
    r.register_command(name, [&calls, name](const std::string& args){ calls.push_back({name, args}); });
  }
  return r;
}

static void test_exact_and_args() {
  std::vector<Call> calls;
  CommandRegistry r = make(calls);
  assert(r.execute("q"));
  assert(r.execute("w out.txt"));
  assert(r.execute("debug"));
  assert(calls.size() == 3);
  assert(calls[0].name == "q" && calls[0].args.empty());
  assert(calls[1].name == "w" && calls[1].args == " out.txt");
  assert(calls[2].name == "debug");
}

static void test_symbol_names_take_raw_remainder() {
  std::vector<Call> calls;
  CommandRegistry r = make(calls);
  assert(r.execute("s/foo/bar"));
  assert(r.execute("/needle"));
  assert(calls[0].name == "s" && calls[0].args == "/foo/bar");
  assert(calls[1].name == "/" && calls[1].args == "needle");
}

static void test_short_and_long_registrations() {
  std::vector<Call> calls;
  CommandRegistry r = make(calls);
  std::string args;
  assert(r.match("f notes.txt", &args) == "f");
  assert(args == " notes.txt");
  // "f" would leave "ile notes.txt"; the word boundary rule skips it
  assert(r.match("file notes.txt", &args) == "file");
  assert(args == " notes.txt");
  assert(r.match("file", &args) == "file");
  assert(args.empty());
}

static void test_unknown_is_dropped() {
  std::vector<Call> calls;
  CommandRegistry r = make(calls);
  assert(!r.execute("wq"));
  assert(!r.execute("fx"));
  assert(!r.execute("zz"));
  assert(!r.execute(""));
  assert(calls.empty());
  assert(r.match("wq").empty());
}

static void test_shortest_match_wins() {
  CommandRegistry r;
  std::string hit;
  r.register_command("x", [&hit](const std::string& a){ hit = "x:" + a; });
  r.register_command("x!", [&hit](const std::string& a){ hit = "x!:" + a; });
  assert(r.execute("x! now"));
  assert(hit == "x:! now");
  assert(r.has("x!"));
  assert(!r.has("y"));
}

int main() {
  test_exact_and_args();
  test_symbol_names_take_raw_remainder();
  test_short_and_long_registrations();
  test_unknown_is_dropped();
  test_shortest_match_wins();
  return 0;
}

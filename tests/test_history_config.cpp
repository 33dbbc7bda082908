#include "history_config.hpp"
#include "cmd_registry.hpp"
#include "test_util.hpp"
#include <cassert>
#include <cstdlib>
#include <string>

static void test_defaults() {
  HistoryConfig plain;
  assert(plain.hot_capacity == 500);
  assert(plain.max_history_depth == 10000);
  assert(plain.group_timeout == std::chrono::milliseconds(500));
  HistoryConfig c = HistoryConfig::defaults();
  assert(c.hot_capacity == 500);
  assert(c.max_history_depth == 10000);
  assert(c.group_timeout == std::chrono::milliseconds(500));
}

static void test_rc_file(const TempDir& dir) {
  auto rc = dir.path() / "scriberc";
  write_text(rc,
    "# comment\n"
    "set hotcapacity 20\r\n"
    ":set maxdepth=300\n"
    "\n"
    "set grouptimeout 0\n"
    "set hotcapacity 0\n"
    "set maxdepth many\n"
    "frobnicate\n"
    "set datadir " + (dir.path() / "hist").string() + "\n");
  HistoryConfig c = HistoryConfig::defaults();
  std::string msg;
  assert(!load_history_config(rc, c, msg));
  assert(c.hot_capacity == 20);
  assert(c.max_history_depth == 300);
  assert(c.group_timeout == std::chrono::milliseconds(0));
  assert(c.data_dir == dir.path() / "hist");
  assert(msg.find(":6:") != std::string::npos);
  assert(msg.find(":7:") != std::string::npos);
  assert(msg.find(":8:") != std::string::npos);
  assert(msg.find(":2:") == std::string::npos);
}

static void test_missing_rc(const TempDir& dir) {
  HistoryConfig c = HistoryConfig::defaults();
  std::string msg;
  assert(load_history_config(dir.path() / "nope", c, msg));
  assert(msg.empty());
  assert(load_history_config(std::filesystem::path(), c, msg));
}

static void test_env_wins(const TempDir& dir) {
  HistoryConfig c = HistoryConfig::defaults();
  c.data_dir = "/somewhere/else";
  setenv("SCRIBE_DATA_DIR", dir.path().c_str(), 1);
  apply_env_overrides(c);
  unsetenv("SCRIBE_DATA_DIR");
  assert(c.data_dir == dir.path());
  assert(describe(c).find("hotcapacity=500") != std::string::npos);
}

static void test_registry() {
  CommandRegistry reg;
  std::string seen;
  reg.register_command("set x", "<v>", [&seen](const std::vector<std::string>& a, std::string&) {
    seen = a.empty() ? "" : a[0];
    return true;
  });
  std::string msg;
  assert(reg.execute_line("set x=5", msg) && seen == "5");
  assert(reg.execute_line("set x 7", msg) && seen == "7");
  assert(!reg.execute_line("set y 1", msg));
  assert(msg == "unknown command: set y");
  assert(reg.has("set x"));
  assert(reg.usage().find("set x") != std::string::npos);
}

int main() {
  TempDir dir;
  assert(dir.ok());
  test_defaults();
  test_rc_file(dir);
  test_missing_rc(dir);
  test_env_wins(dir);
  test_registry();
  return 0;
}

#include "history_config.hpp"
#include "cmd_registry.hpp"
#include "config.hpp"
#include "doc_identity.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <vector>

HistoryConfig HistoryConfig::defaults() {
  HistoryConfig c;
  c.data_dir = resolve_data_dir();
  return c;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return {};
  return std::filesystem::path(home) / SCRIBE_RC_NAME;
}

static bool parse_count(const std::vector<std::string>& args, const char* what, bool allow_zero,
                        uint64_t& out, std::string& msg) {
  std::string usage = std::string("set ") + what + ": use :set " + what + " <number>";
  if (args.size() != 1) { msg = usage; return false; }
  const std::string& s = args[0];
  bool ok = !s.empty() && s.size() <= 18 &&
            std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
  if (!ok) { msg = std::string("set ") + what + ": value must be a number"; return false; }
  out = std::stoull(s);
  if (!allow_zero && out == 0) { msg = std::string("set ") + what + ": value must be >= 1"; return false; }
  return true;
}

static void register_config_commands(CommandRegistry& reg, HistoryConfig& cfg) {
  reg.register_command("set hotcapacity", "<groups kept in memory per document>",
    [&cfg](const std::vector<std::string>& args, std::string& msg) {
      uint64_t v = 0;
      if (!parse_count(args, "hotcapacity", false, v, msg)) return false;
      cfg.hot_capacity = static_cast<size_t>(v);
      return true;
    });
  reg.register_command("set maxdepth", "<total groups kept per document>",
    [&cfg](const std::vector<std::string>& args, std::string& msg) {
      uint64_t v = 0;
      if (!parse_count(args, "maxdepth", false, v, msg)) return false;
      cfg.max_history_depth = static_cast<size_t>(v);
      return true;
    });
  reg.register_command("set grouptimeout", "<milliseconds between merged edits>",
    [&cfg](const std::vector<std::string>& args, std::string& msg) {
      uint64_t v = 0;
      if (!parse_count(args, "grouptimeout", true, v, msg)) return false;
      cfg.group_timeout = std::chrono::milliseconds(static_cast<int64_t>(v));
      return true;
    });
  reg.register_command("set datadir", "<directory holding history.db>",
    [&cfg](const std::vector<std::string>& args, std::string& msg) {
      if (args.empty()) { msg = "set datadir: use :set datadir <path>"; return false; }
      std::string p = args[0];
      for (size_t i = 1; i < args.size(); ++i) p += " " + args[i];
      cfg.data_dir = std::filesystem::path(p);
      return true;
    });
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

bool load_history_config(const std::filesystem::path& rc_path, HistoryConfig& cfg, std::string& msg) {
  if (rc_path.empty()) return true;
  std::error_code ec;
  if (!std::filesystem::exists(rc_path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_readlines(rc_path, lines, msg)) return false;

  CommandRegistry reg;
  register_config_commands(reg, cfg);
  bool all_ok = true;
  for (size_t n = 0; n < lines.size(); ++n) {
    std::string s = trim(lines[n]);
    if (s.empty() || s[0] == '#' || s[0] == '"') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string err;
    if (!reg.execute_line(s, err)) {
      if (!msg.empty()) msg += "; ";
      msg += rc_path.string() + ":" + std::to_string(n + 1) + ": " + err;
      all_ok = false;
    }
  }
  return all_ok;
}

void apply_env_overrides(HistoryConfig& cfg) {
  const char* env = std::getenv(SCRIBE_DATA_DIR_ENV);
  if (env && *env) cfg.data_dir = std::filesystem::path(env);
}

std::string describe(const HistoryConfig& cfg) {
  return "hotcapacity=" + std::to_string(cfg.hot_capacity) +
         " maxdepth=" + std::to_string(cfg.max_history_depth) +
         " grouptimeout=" + std::to_string(cfg.group_timeout.count()) + "ms" +
         " datadir=" + cfg.data_dir.string();
}

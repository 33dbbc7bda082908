#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch named commands (rc-file lines, CLI verbs).
 * Design: map name → handler (args vector, msg); "set x=v" and "set x v" both
 * route to the composite name "set x".
 */
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;

  void register_command(const std::string& name, std::string usage, Handler h) {
    map_[name] = Entry{std::move(usage), std::move(h)};
  }

  bool has(const std::string& name) const { return map_.count(name) != 0; }

  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second.handler(args, msg);
  }

  bool execute_line(const std::string& line, std::string& msg) const {
    std::istringstream iss(line);
    std::string cmd; iss >> cmd;
    std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
    if (cmd == "set" && !args.empty()) {
      std::string name = args[0];
      std::vector<std::string> subargs;
      size_t eq = name.find('=');
      if (eq != std::string::npos) {
        if (eq + 1 < name.size()) subargs.push_back(name.substr(eq + 1));
        name = name.substr(0, eq);
      }
      for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
      return execute("set " + name, subargs, msg);
    }
    return execute(cmd, args, msg);
  }

  /*one "name  usage" line per command, sorted by name*/
  std::string usage() const {
    std::string out;
    for (const auto& [name, e] : map_) out += "  " + name + "  " + e.usage + "\n";
    return out;
  }

private:
  struct Entry {
    std::string usage;
    Handler handler;
  };
  std::map<std::string, Entry> map_;
};

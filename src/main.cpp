#include "cmd_registry.hpp"
#include "codec.hpp"
#include "doc_identity.hpp"
#include "history_config.hpp"
#include "persistence.hpp"
#include "session_store.hpp"
#include "undo_manager.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

static std::string summarize(const EditOperation& op) {
  std::string s = "@" + std::to_string(op.position);
  if (!op.deleted.empty()) s += " -" + std::to_string(utf8_length(op.deleted));
  if (!op.inserted.empty()) s += " +" + std::to_string(utf8_length(op.inserted));
  return s;
}

static std::shared_ptr<PersistenceLayer> open_history(const HistoryConfig& cfg, std::string& msg) {
  return PersistenceLayer::open(cfg.data_dir, msg);
}

static void register_commands(CommandRegistry& reg, const HistoryConfig& cfg) {
  reg.register_command("docs", "list documents with stored history", [&cfg](const std::vector<std::string>&, std::string& msg) {
    auto p = open_history(cfg, msg);
    if (!p) return false;
    std::vector<std::string> docs;
    if (!p->list_documents(docs, msg)) return false;
    for (const auto& d : docs) {
      size_t n = 0;
      if (!p->count_groups(d, n, msg)) return false;
      std::cout << d << "\t" << n << "\n";
    }
    return true;
  });

  reg.register_command("show", "<doc-id>  print metadata and groups", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "usage: show <doc-id>"; return false; }
    auto p = open_history(cfg, msg);
    if (!p) return false;
    const std::string& doc = args[0];
    HistoryMeta m;
    switch (p->load_meta(doc, m, msg)) {
      case GetResult::Found:
        std::cout << "next_seq " << m.next_seq << "\nundo_cursor " << m.undo_cursor << "\n";
        break;
      case GetResult::Missing:
        std::cout << "no metadata\n";
        break;
      case GetResult::Corrupt:
        std::cout << "metadata corrupt\n";
        msg.clear();
        break;
      case GetResult::Error:
        return false;
    }
    std::vector<uint64_t> seqs;
    if (!p->list_group_seqs(doc, seqs, msg)) return false;
    for (uint64_t seq : seqs) {
      EditGroup g;
      std::string gerr;
      GetResult r = p->read_group(doc, seq, g, gerr);
      if (r == GetResult::Error) { msg = gerr; return false; }
      std::cout << "group " << seq;
      if (r != GetResult::Found) { std::cout << " (corrupt)\n"; continue; }
      for (const auto& op : g.operations) std::cout << "  " << summarize(op);
      std::cout << "\n";
    }
    return true;
  });

  reg.register_command("id", "<path>  print the document id of a file", [](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "usage: id <path>"; return false; }
    std::cout << doc_id_for_path(args[0]) << "\n";
    return true;
  });

  reg.register_command("drop", "<doc-id>  delete the stored history of a document", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "usage: drop <doc-id>"; return false; }
    auto p = open_history(cfg, msg);
    if (!p) return false;
    UndoManager um(args[0], cfg, p);
    return um.delete_history(msg) && p->flush(msg);
  });

  reg.register_command("session", "[db-path]  print saved tabs and unsaved buffers", [](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() > 1) { msg = "usage: session [db-path]"; return false; }
    auto store = SessionStore::open(args.empty() ? session_db_path() : std::filesystem::path(args[0]), msg);
    if (!store) return false;
    SessionData s;
    GetResult r = store->load_session(s, msg);
    if (r == GetResult::Error) return false;
    if (r == GetResult::Missing) std::cout << "no saved session\n";
    for (size_t i = 0; i < s.tabs.size(); ++i) {
      std::cout << (i == s.active_tab_index ? "* " : "  ");
      if (const auto* f = std::get_if<FileTab>(&s.tabs[i])) std::cout << "file " << f->path << "\n";
      else {
        const auto& u = std::get<UnsavedTab>(s.tabs[i]);
        std::cout << "unsaved " << u.session_id << " \"" << u.title << "\"\n";
      }
    }
    std::vector<std::string> ids;
    if (!store->list_content_ids(ids, msg)) return false;
    for (const auto& id : ids) {
      std::string text;
      if (store->load_content(id, text, msg) != GetResult::Found) return false;
      std::cout << "content " << id << " " << text.size() << " bytes\n";
    }
    return true;
  });

  reg.register_command("config", "print the effective configuration", [&cfg](const std::vector<std::string>&, std::string&) {
    std::cout << describe(cfg);
    return true;
  });
}

static void print_usage(const CommandRegistry& reg) {
  std::cerr << "usage: scribe-history [--data-dir DIR] <command> [args]\n" << reg.usage();
}

int main(int argc, char** argv) {
  HistoryConfig cfg = HistoryConfig::defaults();
  std::string msg;
  if (!load_history_config(default_rc_path(), cfg, msg)) std::cerr << "warning: " << msg << "\n";
  apply_env_overrides(cfg);

  CommandRegistry reg;
  register_commands(reg, cfg);

  int i = 1;
  if (i + 1 < argc && std::string(argv[i]) == "--data-dir") {
    cfg.data_dir = argv[i + 1];
    i += 2;
  }
  if (i >= argc) { print_usage(reg); return 2; }
  std::string cmd = argv[i++];
  if (!reg.has(cmd)) { std::cerr << "unknown command: " << cmd << "\n"; print_usage(reg); return 2; }
  std::vector<std::string> args(argv + i, argv + argc);
  msg.clear();
  if (!reg.execute(cmd, args, msg)) {
    std::cerr << "scribe-history: " << msg << "\n";
    return 1;
  }
  if (!msg.empty()) std::cerr << msg << "\n";
  return 0;
}

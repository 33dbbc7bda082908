#include "undo_manager.hpp"
#include "test_util.hpp"
#include <chrono>
#include <iostream>
#include <string>

struct BenchCfg {
  int groups = 20000;        // sealed groups recorded
  size_t hot_capacity = 500;
  size_t max_depth = 10000;
  int undo_iters = 5000;     // undos, mostly served from disk
};

static double ms_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}

static HistoryConfig make_config(const BenchCfg& b, const std::filesystem::path& dir) {
  HistoryConfig c = HistoryConfig::defaults();
  c.hot_capacity = b.hot_capacity;
  c.max_history_depth = b.max_depth;
  c.data_dir = dir;
  return c;
}

static bool record_groups(UndoManager& um, int n) {
  std::string msg;
  for (int i = 0; i < n; ++i) {
    EditOperation op;
    op.position = static_cast<uint64_t>(i);
    op.inserted = "x";
    op.cursor_after = CursorSnapshot{0, static_cast<uint64_t>(i + 1)};
    if (!um.record(op, msg) || !um.break_group(msg)) {
      std::cerr << "record failed: " << msg << "\n";
      return false;
    }
  }
  return true;
}

int main() {
  BenchCfg b;
  TempDir dir;
  if (!dir.ok()) { std::cerr << "no temp dir\n"; return 1; }
  std::string msg;

  {
    UndoManager mem("mem", make_config(b, dir.path()));
    auto t0 = std::chrono::steady_clock::now();
    if (!record_groups(mem, b.groups)) return 1;
    std::cout << "record (memory)   " << b.groups << " groups: " << ms_since(t0) << " ms\n";
  }

  auto p = PersistenceLayer::open(dir.path(), msg);
  if (!p) { std::cerr << msg << "\n"; return 1; }
  {
    UndoManager um("disk", make_config(b, dir.path()), p);
    auto t0 = std::chrono::steady_clock::now();
    if (!record_groups(um, b.groups)) return 1;
    std::cout << "record (spilling) " << b.groups << " groups: " << ms_since(t0) << " ms\n";

    t0 = std::chrono::steady_clock::now();
    if (!um.flush(msg)) { std::cerr << msg << "\n"; return 1; }
    std::cout << "flush: " << ms_since(t0) << " ms\n";

    t0 = std::chrono::steady_clock::now();
    int done = 0;
    while (done < b.undo_iters && um.undo(msg)) done++;
    std::cout << "undo " << done << " groups: " << ms_since(t0) << " ms\n";
    if (!um.flush(msg)) { std::cerr << msg << "\n"; return 1; }
  }

  auto t0 = std::chrono::steady_clock::now();
  UndoManager again = UndoManager::load_or_new("disk", make_config(b, dir.path()), p, msg);
  std::cout << "load_or_new " << again.total_groups() << " groups: " << ms_since(t0) << " ms\n";
  if (!msg.empty()) std::cerr << msg << "\n";
  return 0;
}

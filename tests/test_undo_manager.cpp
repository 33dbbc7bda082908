#include "undo_manager.hpp"
#include <cassert>
#include <chrono>
#include <string>

using Clock = UndoManager::Clock;
using std::chrono::milliseconds;

static HistoryConfig config(size_t hot, size_t depth) {
  HistoryConfig c;
  c.hot_capacity = hot;
  c.max_history_depth = depth;
  c.group_timeout = milliseconds(500);
  return c;
}

/*a text buffer that records every edit it makes*/
struct Doc {
  std::string text;
  UndoManager um;
  Clock::time_point now = Clock::now();

  explicit Doc(HistoryConfig c) : um("doc", std::move(c)) {}

  void edit(uint64_t pos, const std::string& ins, const std::string& del, milliseconds gap = milliseconds(10)) {
    EditOperation op;
    op.position = pos;
    op.inserted = ins;
    op.deleted = del;
    op.cursor_before = CursorSnapshot{0, pos + utf8_length(del)};
    op.cursor_after = CursorSnapshot{0, pos + utf8_length(ins)};
    bool applied = apply_forward(text, op);
    assert(applied);
    now += gap;
    std::string msg;
    assert(um.record(op, now, msg));
    assert(msg.empty());
  }
  void type(const std::string& s, milliseconds gap = milliseconds(10)) { edit(utf8_length(text), s, "", gap); }
  void backspace() {
    size_t n = utf8_length(text);
    size_t at = utf8_byte_offset(text, n - 1);
    edit(n - 1, "", text.substr(at));
  }

  bool undo(CursorSnapshot* cursor = nullptr) {
    std::string msg;
    auto step = um.undo(msg);
    if (!step) return false;
    um.pause_recording();
    for (const auto& op : step->operations) {
      bool ok = apply_forward(text, op);
      assert(ok);
    }
    um.resume_recording();
    if (cursor) *cursor = step->cursor;
    return true;
  }
  bool redo(CursorSnapshot* cursor = nullptr) {
    std::string msg;
    auto step = um.redo(msg);
    if (!step) return false;
    um.pause_recording();
    for (const auto& op : step->operations) {
      bool ok = apply_forward(text, op);
      assert(ok);
    }
    um.resume_recording();
    if (cursor) *cursor = step->cursor;
    return true;
  }
  void seal() {
    std::string msg;
    assert(um.break_group(msg));
  }
};

static void test_typing_coalesces() {
  Doc d(config(100, 100));
  d.type("h");
  d.type("e");
  d.type("\xC3\xA9");
  assert(d.um.has_open_group());
  assert(d.um.total_groups() == 0);
  assert(d.um.can_undo());
  d.seal();
  assert(d.um.total_groups() == 1);
  assert(d.undo());
  assert(d.text.empty());
  assert(!d.um.can_undo());
}

static void test_group_boundaries() {
  Doc d(config(100, 100));
  d.type("a");
  d.type("b", milliseconds(500));   // still inside the window
  d.type("c", milliseconds(501));   // gap too long
  d.type("xyz");                    // paste
  d.type("d");                      // typing after a paste
  d.backspace();                    // direction change
  d.backspace();
  d.seal();
  assert(d.um.total_groups() == 5);
  assert(d.text == "abcxy");
  assert(d.undo() && d.text == "abcxyzd");
  assert(d.undo() && d.text == "abcxyz");
  assert(d.undo() && d.text == "abc");
  assert(d.undo() && d.text == "ab");
  assert(d.undo() && d.text.empty());
  assert(!d.undo());
}

static void test_undo_redo_restores_state() {
  Doc d(config(100, 100));
  d.type("hello");
  d.seal();
  d.edit(0, "J", "h");
  d.seal();
  std::string after = d.text;
  CursorSnapshot c;
  assert(d.undo(&c));
  assert(d.text == "hello");
  assert(c == (CursorSnapshot{0, 1}));
  assert(d.um.can_redo());
  assert(d.redo(&c));
  assert(d.text == after);
  assert(c == (CursorSnapshot{0, 1}));
  assert(!d.um.can_redo());
  assert(!d.redo());
}

static void test_undo_seals_open_group() {
  Doc d(config(100, 100));
  d.type("a");
  d.type("b");
  assert(d.undo());
  assert(d.text.empty());
  assert(d.redo());
  assert(d.text == "ab");
}

static void test_edit_discards_redo_tail() {
  Doc d(config(100, 100));
  for (const char* s : {"one ", "two ", "three "}) { d.type(s); d.seal(); }
  assert(d.undo());
  assert(d.undo());
  assert(d.text == "one ");
  assert(d.um.can_redo());
  d.type("X");
  assert(!d.um.can_redo());
  d.seal();
  assert(d.um.total_groups() == 2);
  assert(!d.redo());
  assert(d.undo() && d.text == "one ");
  assert(d.undo() && d.text.empty());
}

static void test_paused_recording() {
  Doc d(config(100, 100));
  d.um.pause_recording();
  assert(!d.um.recording());
  d.type("ignored");
  assert(!d.um.can_undo());
  d.um.resume_recording();
  d.type("x");
  assert(d.um.can_undo());
}

static void test_depth_limit_in_memory() {
  Doc d(config(2, 3));
  for (int i = 0; i < 5; ++i) { d.type(std::to_string(i) + "-"); d.seal(); }
  assert(d.um.total_groups() == 3);
  assert(d.um.undo_cursor() == 3);
  // memory-only history ignores hot_capacity
  assert(d.um.hot_seqs().size() == 3);
  assert(d.um.cold_seqs().empty());
  assert(d.undo() && d.undo() && d.undo());
  assert(d.text == "0-1-");
  assert(!d.undo());
  assert(d.um.next_seq() == 5);
}

int main() {
  test_typing_coalesces();
  test_group_boundaries();
  test_undo_redo_restores_state();
  test_undo_seals_open_group();
  test_edit_discards_redo_tail();
  test_paused_recording();
  test_depth_limit_in_memory();
  return 0;
}

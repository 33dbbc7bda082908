#pragma once
/*
 * UndoManager
 *
 * Purpose: linear undo/redo history of one document, in two tiers.
 *   hot:  newest sealed groups in memory (at most hot_capacity when persistent)
 *   cold: older groups living only in the PersistenceLayer, indexed by seq
 * The undo cursor indexes the logical sequence cold ++ hot and points one past
 * the last applied group. Recording after an undo discards the redo tail.
 * Errors: fallible calls report through msg; the edit itself is never dropped,
 * and a failed spill leaves groups in memory past capacity.
 */
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "codec.hpp"
#include "edit_model.hpp"
#include "history_config.hpp"
#include "persistence.hpp"

/*operations to apply, in order, and where to put the cursor afterwards*/
struct UndoStep {
  std::vector<EditOperation> operations;
  CursorSnapshot cursor;
};

class UndoManager {
public:
  using Clock = std::chrono::steady_clock;

  /*persistence == nullptr: memory-only history (scratch documents, tests)*/
  UndoManager(std::string doc_id, HistoryConfig config, std::shared_ptr<PersistenceLayer> persistence = nullptr);

  /*never fails; unreadable history degrades to an empty one and is reported in msg*/
  static UndoManager load_or_new(std::string doc_id, HistoryConfig config,
                                 std::shared_ptr<PersistenceLayer> persistence, std::string& msg);

  const std::string& doc_id() const { return doc_id_; }

  bool record(const EditOperation& op, Clock::time_point now, std::string& msg);
  bool record(const EditOperation& op, std::string& msg) { return record(op, Clock::now(), msg); }
  /*close the open group so the next edit starts a new undo step*/
  bool break_group(std::string& msg);

  std::optional<UndoStep> undo(std::string& msg);
  std::optional<UndoStep> redo(std::string& msg);

  bool flush(std::string& msg);
  bool delete_history(std::string& msg);

  bool can_undo() const { return undo_cursor_ > 0 || !current_.operations.empty(); }
  bool can_redo() const { return current_.operations.empty() && undo_cursor_ < total_groups(); }

  /*while paused, record() is a no-op (used while replaying undo/redo)*/
  void pause_recording() { recording_ = false; }
  void resume_recording() { recording_ = true; }
  bool recording() const { return recording_; }

  size_t total_groups() const { return cold_.size() + hot_.size(); }
  size_t undo_cursor() const { return undo_cursor_; }
  uint64_t next_seq() const { return next_seq_; }
  bool has_open_group() const { return !current_.operations.empty(); }
  bool has_persistence() const { return persistence_ != nullptr; }
  std::vector<uint64_t> hot_seqs() const;
  std::vector<uint64_t> cold_seqs() const { return std::vector<uint64_t>(cold_.begin(), cold_.end()); }
  const HistoryConfig& config() const { return config_; }

private:
  bool seal(std::string& msg);
  bool enforce_limits(std::string& msg);
  bool truncate_redo(std::string& msg);
  GetResult group_at(size_t index, EditGroup& out, std::string& msg) const;
  void drop_cold(size_t index);
  bool write(const WriteBatch& b, std::string& msg);
  HistoryMeta meta() const { return HistoryMeta{next_seq_, undo_cursor_}; }

  std::string doc_id_;
  HistoryConfig config_;
  std::shared_ptr<PersistenceLayer> persistence_;

  std::deque<EditGroup> hot_;
  std::deque<uint64_t> cold_;
  EditGroup current_;
  size_t undo_cursor_ = 0;
  uint64_t next_seq_ = 0;
  std::optional<Clock::time_point> last_edit_time_;

  /*hot groups with seq < flushed_until_ are already on disk*/
  uint64_t flushed_until_ = 0;
  /*deletes that failed to commit; retried with the next write*/
  std::vector<uint64_t> pending_deletes_;
  bool purge_pending_ = false;
  bool recording_ = true;
  bool dirty_ = false;
};

#include "undo_manager.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

// Rows: kind of the last op in the open group. Columns: kind of the incoming op.
// true = the incoming op extends the open group (within group_timeout).
static constexpr bool kMergePolicy[3][3] = {
  /*               InsertChar DeleteChar Other */
  /* InsertChar */ {true,      false,     false},
  /* DeleteChar */ {false,     true,      false},
  /* Other      */ {false,     false,     false},
};

static bool merges(const EditOperation& last, const EditOperation& next) {
  return kMergePolicy[static_cast<int>(classify(last))][static_cast<int>(classify(next))];
}

static void note(std::string& msg, const std::string& m) {
  if (m.empty()) return;
  if (!msg.empty()) msg += "; ";
  msg += m;
}

UndoManager::UndoManager(std::string doc_id, HistoryConfig config, std::shared_ptr<PersistenceLayer> persistence)
  : doc_id_(std::move(doc_id)), config_(std::move(config)), persistence_(std::move(persistence)) {}

UndoManager UndoManager::load_or_new(std::string doc_id, HistoryConfig config,
                                     std::shared_ptr<PersistenceLayer> persistence, std::string& msg) {
  UndoManager m(doc_id, config, persistence);
  if (!m.persistence_) return m;

  std::string err;
  HistoryMeta stored;
  GetResult meta_r = m.persistence_->load_meta(m.doc_id_, stored, err);
  std::vector<uint64_t> seqs;
  bool ok = meta_r != GetResult::Error && m.persistence_->list_group_seqs(m.doc_id_, seqs, err);
  if (ok && meta_r == GetResult::Corrupt) {
    note(msg, err);
    err.clear();
  }
  if (ok) {
    size_t total = seqs.size();
    size_t hot_start = total > m.config_.hot_capacity ? total - m.config_.hot_capacity : 0;
    size_t cursor = meta_r == GetResult::Found ? std::min<size_t>(stored.undo_cursor, total) : total;
    size_t skipped_before_cursor = 0;
    for (size_t i = 0; i < hot_start; ++i) m.cold_.push_back(seqs[i]);
    for (size_t i = hot_start; ok && i < total; ++i) {
      EditGroup g;
      std::string gerr;
      switch (m.persistence_->read_group(m.doc_id_, seqs[i], g, gerr)) {
        case GetResult::Found:
          m.hot_.push_back(std::move(g));
          break;
        case GetResult::Error:
          err = gerr;
          ok = false;
          break;
        case GetResult::Missing:
        case GetResult::Corrupt:
          note(msg, gerr.empty() ? m.doc_id_ + ": group " + std::to_string(seqs[i]) + " vanished" : gerr);
          m.pending_deletes_.push_back(seqs[i]);
          if (i < cursor) skipped_before_cursor++;
          break;
      }
    }
    if (ok) {
      uint64_t after_last = seqs.empty() ? 0 : seqs.back() + 1;
      uint64_t stored_next = meta_r == GetResult::Found ? stored.next_seq : 0;
      m.next_seq_ = std::max(stored_next, after_last);
      m.undo_cursor_ = cursor - skipped_before_cursor;
      m.flushed_until_ = m.next_seq_;
      m.dirty_ = !m.pending_deletes_.empty();
      return m;
    }
  }

  note(msg, m.doc_id_ + ": history unavailable, starting empty: " + err);
  UndoManager fresh(std::move(doc_id), std::move(config), std::move(persistence));
  std::string purge_err;
  if (!fresh.persistence_->delete_all(fresh.doc_id_, purge_err)) {
    note(msg, fresh.doc_id_ + ": can not clear stale history, keeping it in memory only: " + purge_err);
    fresh.persistence_.reset();
  }
  return fresh;
}

std::vector<uint64_t> UndoManager::hot_seqs() const {
  std::vector<uint64_t> out;
  out.reserve(hot_.size());
  for (const auto& g : hot_) out.push_back(g.seq);
  return out;
}

bool UndoManager::write(const WriteBatch& b, std::string& msg) {
  WriteBatch full;
  if (purge_pending_) full.del_namespace(doc_id_);
  for (uint64_t seq : pending_deletes_) PersistenceLayer::stage_group_delete(full, doc_id_, seq);
  full.append(b);
  PersistenceLayer::stage_meta(full, doc_id_, meta());
  std::string err;
  if (!persistence_->commit(full, err)) {
    note(msg, doc_id_ + ": history write failed: " + err);
    return false;
  }
  purge_pending_ = false;
  pending_deletes_.clear();
  return true;
}

bool UndoManager::record(const EditOperation& op, Clock::time_point now, std::string& msg) {
  if (!recording_) return true;
  bool ok = truncate_redo(msg);
  bool extend = !current_.operations.empty() && last_edit_time_ &&
                now - *last_edit_time_ <= config_.group_timeout &&
                merges(current_.operations.back(), op);
  if (!extend && !seal(msg)) ok = false;
  current_.operations.push_back(op);
  last_edit_time_ = now;
  dirty_ = true;
  return ok;
}

bool UndoManager::break_group(std::string& msg) {
  last_edit_time_.reset();
  return seal(msg);
}

bool UndoManager::seal(std::string& msg) {
  if (current_.operations.empty()) return true;
  current_.seq = next_seq_++;
  hot_.push_back(std::move(current_));
  current_ = EditGroup{};
  undo_cursor_ = total_groups();
  dirty_ = true;
  return enforce_limits(msg);
}

bool UndoManager::enforce_limits(std::string& msg) {
  // evict oldest-first from whichever tier holds it
  std::vector<uint64_t> evicted;
  while (total_groups() > config_.max_history_depth) {
    if (!cold_.empty()) {
      evicted.push_back(cold_.front());
      cold_.pop_front();
    } else {
      if (hot_.front().seq < flushed_until_) evicted.push_back(hot_.front().seq);
      hot_.pop_front();
    }
    if (undo_cursor_ > 0) undo_cursor_--;
  }
  if (!persistence_) return true;
  pending_deletes_.insert(pending_deletes_.end(), evicted.begin(), evicted.end());

  size_t spill = hot_.size() > config_.hot_capacity ? hot_.size() - config_.hot_capacity : 0;
  if (spill == 0 && evicted.empty()) return true;
  WriteBatch b;
  for (size_t i = 0; i < spill; ++i) PersistenceLayer::stage_group(b, doc_id_, hot_[i]);
  if (!write(b, msg)) return false;
  for (size_t i = 0; i < spill; ++i) {
    cold_.push_back(hot_.front().seq);
    hot_.pop_front();
  }
  return true;
}

bool UndoManager::truncate_redo(std::string& msg) {
  if (undo_cursor_ >= total_groups()) return true;
  std::vector<uint64_t> dropped;
  while (total_groups() > undo_cursor_) {
    if (!hot_.empty()) {
      if (hot_.back().seq < flushed_until_) dropped.push_back(hot_.back().seq);
      hot_.pop_back();
    } else {
      dropped.push_back(cold_.back());
      cold_.pop_back();
    }
  }
  dirty_ = true;
  if (!persistence_ || dropped.empty()) return true;
  pending_deletes_.insert(pending_deletes_.end(), dropped.begin(), dropped.end());
  return write(WriteBatch{}, msg);
}

GetResult UndoManager::group_at(size_t index, EditGroup& out, std::string& msg) const {
  if (index >= cold_.size()) {
    out = hot_[index - cold_.size()];
    return GetResult::Found;
  }
  if (!persistence_) return GetResult::Missing;
  return persistence_->read_group(doc_id_, cold_[index], out, msg);
}

void UndoManager::drop_cold(size_t index) {
  pending_deletes_.push_back(cold_[index]);
  cold_.erase(cold_.begin() + static_cast<std::ptrdiff_t>(index));
  dirty_ = true;
}

std::optional<UndoStep> UndoManager::undo(std::string& msg) {
  std::string seal_err;
  if (!seal(seal_err)) note(msg, seal_err);
  while (undo_cursor_ > 0) {
    size_t idx = undo_cursor_ - 1;
    EditGroup g;
    std::string err;
    GetResult r = group_at(idx, g, err);
    if (r == GetResult::Error) {
      note(msg, doc_id_ + ": can not load history: " + err);
      return std::nullopt;
    }
    if (r != GetResult::Found) {
      // unavailable group: skip it and keep walking back
      note(msg, err.empty() ? doc_id_ + ": group missing from store" : err);
      drop_cold(idx);
      undo_cursor_--;
      continue;
    }
    undo_cursor_ = idx;
    dirty_ = true;
    UndoStep step;
    step.operations.reserve(g.operations.size());
    for (auto it = g.operations.rbegin(); it != g.operations.rend(); ++it) step.operations.push_back(it->reversed());
    step.cursor = g.operations.front().cursor_before;
    return step;
  }
  return std::nullopt;
}

std::optional<UndoStep> UndoManager::redo(std::string& msg) {
  if (!current_.operations.empty()) return std::nullopt;
  while (undo_cursor_ < total_groups()) {
    EditGroup g;
    std::string err;
    GetResult r = group_at(undo_cursor_, g, err);
    if (r == GetResult::Error) {
      note(msg, doc_id_ + ": can not load history: " + err);
      return std::nullopt;
    }
    if (r != GetResult::Found) {
      note(msg, err.empty() ? doc_id_ + ": group missing from store" : err);
      drop_cold(undo_cursor_);
      continue;
    }
    undo_cursor_++;
    dirty_ = true;
    UndoStep step;
    step.cursor = g.operations.back().cursor_after;
    step.operations = std::move(g.operations);
    return step;
  }
  return std::nullopt;
}

bool UndoManager::flush(std::string& msg) {
  if (!persistence_) return true;
  // a failed spill here is repaired by the full write below
  std::string seal_err;
  bool sealed = seal(seal_err);
  if (!dirty_ && pending_deletes_.empty() && !purge_pending_) return true;
  WriteBatch b;
  for (const auto& g : hot_) if (g.seq >= flushed_until_) PersistenceLayer::stage_group(b, doc_id_, g);
  if (!write(b, msg)) {
    if (!sealed) note(msg, seal_err);
    return false;
  }
  flushed_until_ = next_seq_;
  dirty_ = false;
  // everything is on disk now, so the hot tier can shrink without another write
  while (hot_.size() > config_.hot_capacity) {
    cold_.push_back(hot_.front().seq);
    hot_.pop_front();
  }
  std::string err;
  if (!persistence_->flush(err)) {
    note(msg, doc_id_ + ": history flush failed: " + err);
    return false;
  }
  return true;
}

bool UndoManager::delete_history(std::string& msg) {
  hot_.clear();
  cold_.clear();
  current_ = EditGroup{};
  undo_cursor_ = 0;
  next_seq_ = 0;
  flushed_until_ = 0;
  last_edit_time_.reset();
  pending_deletes_.clear();
  dirty_ = false;
  if (!persistence_) return true;
  std::string err;
  if (!persistence_->delete_all(doc_id_, err)) {
    purge_pending_ = true;
    note(msg, doc_id_ + ": can not delete history: " + err);
    return false;
  }
  purge_pending_ = false;
  return true;
}

#pragma once
/*
 * PersistenceLayer
 *
 * Purpose: per-document keyspaces over one KvStore at <data_dir>/history.db.
 * Layout inside a document's namespace:
 *   'g' + be64(seq) → encode_group(EditGroup)
 *   "meta"          → encode_meta({next_seq, undo_cursor})
 * Multi-key updates go through WriteBatch so they commit atomically.
 * One handle per data_dir per process; share it with std::shared_ptr.
 */
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "codec.hpp"
#include "edit_model.hpp"
#include "kv_store.hpp"

class PersistenceLayer {
public:
  static std::shared_ptr<PersistenceLayer> open(const std::filesystem::path& data_dir, std::string& msg);

  /*raw byte contract*/
  bool put(const std::string& doc_id, const std::string& key, const std::string& bytes, std::string& msg);
  GetResult get(const std::string& doc_id, const std::string& key, std::string& out, std::string& msg) const;
  bool remove(const std::string& doc_id, const std::string& key, std::string& msg);
  bool delete_all(const std::string& doc_id, std::string& msg);
  bool flush(std::string& msg);
  bool commit(const WriteBatch& batch, std::string& msg);

  static std::string group_key(uint64_t seq);
  static const std::string& meta_key();
  static void stage_group(WriteBatch& b, const std::string& doc_id, const EditGroup& g);
  static void stage_group_delete(WriteBatch& b, const std::string& doc_id, uint64_t seq);
  static void stage_meta(WriteBatch& b, const std::string& doc_id, const HistoryMeta& m);

  GetResult read_group(const std::string& doc_id, uint64_t seq, EditGroup& out, std::string& msg) const;
  /*ascending*/
  bool list_group_seqs(const std::string& doc_id, std::vector<uint64_t>& out, std::string& msg) const;
  bool count_groups(const std::string& doc_id, size_t& out, std::string& msg) const;

  GetResult load_meta(const std::string& doc_id, HistoryMeta& out, std::string& msg) const;

  bool list_documents(std::vector<std::string>& out, std::string& msg) const;

  const std::filesystem::path& path() const { return kv_->path(); }

private:
  explicit PersistenceLayer(std::unique_ptr<KvStore> kv) : kv_(std::move(kv)) {}
  std::unique_ptr<KvStore> kv_;
};

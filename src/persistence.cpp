#include "persistence.hpp"
#include "config.hpp"
#include <string_view>

static constexpr char kGroupTag = 'g';

std::shared_ptr<PersistenceLayer> PersistenceLayer::open(const std::filesystem::path& data_dir, std::string& msg) {
  auto kv = KvStore::open(data_dir / SCRIBE_HISTORY_DB, msg);
  if (!kv) return nullptr;
  return std::shared_ptr<PersistenceLayer>(new PersistenceLayer(std::move(kv)));
}

bool PersistenceLayer::put(const std::string& doc_id, const std::string& key, const std::string& bytes, std::string& msg) {
  return kv_->put(doc_id, key, bytes, msg);
}

GetResult PersistenceLayer::get(const std::string& doc_id, const std::string& key, std::string& out, std::string& msg) const {
  return kv_->get(doc_id, key, out, msg);
}

bool PersistenceLayer::remove(const std::string& doc_id, const std::string& key, std::string& msg) {
  return kv_->del(doc_id, key, msg);
}

bool PersistenceLayer::delete_all(const std::string& doc_id, std::string& msg) {
  return kv_->del_namespace(doc_id, msg);
}

bool PersistenceLayer::flush(std::string& msg) { return kv_->checkpoint(msg); }

bool PersistenceLayer::commit(const WriteBatch& batch, std::string& msg) { return kv_->commit(batch, msg); }

std::string PersistenceLayer::group_key(uint64_t seq) {
  return std::string(1, kGroupTag) + encode_ordered_u64(seq);
}

const std::string& PersistenceLayer::meta_key() {
  static const std::string k = "meta";
  return k;
}

static bool is_group_key(const std::string& key) { return key.size() == 9 && key[0] == kGroupTag; }

void PersistenceLayer::stage_group(WriteBatch& b, const std::string& doc_id, const EditGroup& g) {
  b.put(doc_id, group_key(g.seq), encode_group(g));
}

void PersistenceLayer::stage_group_delete(WriteBatch& b, const std::string& doc_id, uint64_t seq) {
  b.del(doc_id, group_key(seq));
}

void PersistenceLayer::stage_meta(WriteBatch& b, const std::string& doc_id, const HistoryMeta& m) {
  b.put(doc_id, meta_key(), encode_meta(m));
}

GetResult PersistenceLayer::read_group(const std::string& doc_id, uint64_t seq, EditGroup& out, std::string& msg) const {
  std::string bytes;
  GetResult r = kv_->get(doc_id, group_key(seq), bytes, msg);
  if (r != GetResult::Found) return r;
  EditGroup g;
  if (!decode_group(bytes, g) || g.seq != seq || g.operations.empty()) {
    msg = doc_id + ": stored group " + std::to_string(seq) + " is corrupt";
    return GetResult::Corrupt;
  }
  out = std::move(g);
  return GetResult::Found;
}

bool PersistenceLayer::list_group_seqs(const std::string& doc_id, std::vector<uint64_t>& out, std::string& msg) const {
  out.clear();
  std::vector<std::string> keys;
  if (!kv_->keys(doc_id, keys, msg)) return false;
  for (const auto& k : keys) {
    uint64_t seq = 0;
    if (is_group_key(k) && decode_ordered_u64(std::string_view(k).substr(1), seq)) out.push_back(seq);
  }
  return true;
}

bool PersistenceLayer::count_groups(const std::string& doc_id, size_t& out, std::string& msg) const {
  std::vector<uint64_t> seqs;
  if (!list_group_seqs(doc_id, seqs, msg)) return false;
  out = seqs.size();
  return true;
}

GetResult PersistenceLayer::load_meta(const std::string& doc_id, HistoryMeta& out, std::string& msg) const {
  std::string bytes;
  GetResult r = kv_->get(doc_id, meta_key(), bytes, msg);
  if (r != GetResult::Found) return r;
  if (!decode_meta(bytes, out)) {
    msg = doc_id + ": history metadata is corrupt";
    return GetResult::Corrupt;
  }
  return GetResult::Found;
}

bool PersistenceLayer::list_documents(std::vector<std::string>& out, std::string& msg) const {
  return kv_->namespaces(out, msg);
}

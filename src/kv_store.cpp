#include "kv_store.hpp"
#include "config.hpp"
#include <sqlite3.h>

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* s) const { sqlite3_finalize(s); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

void bind_text(sqlite3_stmt* s, int idx, const std::string& v) {
  sqlite3_bind_text(s, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

// data() is never null, so empty strings bind as zero-length blobs, not NULL
void bind_blob(sqlite3_stmt* s, int idx, const std::string& v) {
  sqlite3_bind_blob(s, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

std::string column_bytes(sqlite3_stmt* s, int col) {
  const void* p = sqlite3_column_blob(s, col);
  int n = sqlite3_column_bytes(s, col);
  if (!p || n <= 0) return std::string();
  return std::string(static_cast<const char*>(p), static_cast<size_t>(n));
}

const char* kSchema =
  "CREATE TABLE IF NOT EXISTS kv("
  "  ns TEXT NOT NULL,"
  "  key BLOB NOT NULL,"
  "  value BLOB NOT NULL,"
  "  PRIMARY KEY(ns, key)"
  ") WITHOUT ROWID;";

}  // namespace

std::unique_ptr<KvStore> KvStore::open(const std::filesystem::path& file, std::string& msg) {
  std::unique_ptr<KvStore> kv(new KvStore());
  kv->path_ = file;
  std::error_code ec;
  if (file.has_parent_path()) {
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) { msg = "can not create directory " + file.parent_path().string() + ": " + ec.message(); return nullptr; }
  }
  std::string lock_path = file.string() + SCRIBE_LOCK_SUFFIX;
  if (!kv->lock_.try_acquire(lock_path.c_str())) {
    msg = "store is locked by another writer: " + file.string();
    return nullptr;
  }
  int rc = sqlite3_open_v2(file.string().c_str(), &kv->db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    msg = kv->error("can not open store");
    return nullptr;
  }
  if (!kv->exec("PRAGMA journal_mode=WAL;", msg)) return nullptr;
  if (!kv->exec("PRAGMA synchronous=NORMAL;", msg)) return nullptr;
  if (!kv->exec(kSchema, msg)) return nullptr;
  return kv;
}

KvStore::~KvStore() {
  if (db_) sqlite3_close_v2(db_);
}

std::string KvStore::error(const char* what) const {
  std::string m = std::string(what) + " (" + path_.string() + ")";
  if (db_) m += ": " + std::string(sqlite3_errmsg(db_));
  return m;
}

bool KvStore::exec(const char* sql, std::string& msg) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    msg = std::string("store error (") + path_.string() + "): " + (err ? err : "unknown");
    sqlite3_free(err);
    return false;
  }
  return true;
}

sqlite3_stmt* KvStore::prepare(const char* sql, std::string& msg) const {
  sqlite3_stmt* s = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &s, nullptr) != SQLITE_OK) {
    msg = error("can not prepare statement");
    sqlite3_finalize(s);
    return nullptr;
  }
  return s;
}

bool KvStore::put(const std::string& ns, const std::string& key, const std::string& value, std::string& msg) {
  WriteBatch b;
  b.put(ns, key, value);
  return commit(b, msg);
}

GetResult KvStore::get(const std::string& ns, const std::string& key, std::string& out, std::string& msg) const {
  Stmt s(prepare("SELECT value FROM kv WHERE ns = ?1 AND key = ?2;", msg));
  if (!s) return GetResult::Error;
  bind_text(s.get(), 1, ns);
  bind_blob(s.get(), 2, key);
  int rc = sqlite3_step(s.get());
  if (rc == SQLITE_ROW) { out = column_bytes(s.get(), 0); return GetResult::Found; }
  if (rc == SQLITE_DONE) return GetResult::Missing;
  msg = error("read failed");
  return GetResult::Error;
}

bool KvStore::del(const std::string& ns, const std::string& key, std::string& msg) {
  WriteBatch b;
  b.del(ns, key);
  return commit(b, msg);
}

bool KvStore::del_namespace(const std::string& ns, std::string& msg) {
  WriteBatch b;
  b.del_namespace(ns);
  return commit(b, msg);
}

bool KvStore::keys(const std::string& ns, std::vector<std::string>& out, std::string& msg) const {
  out.clear();
  Stmt s(prepare("SELECT key FROM kv WHERE ns = ?1 ORDER BY key;", msg));
  if (!s) return false;
  bind_text(s.get(), 1, ns);
  int rc;
  while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) out.push_back(column_bytes(s.get(), 0));
  if (rc != SQLITE_DONE) { msg = error("key scan failed"); return false; }
  return true;
}

bool KvStore::namespaces(std::vector<std::string>& out, std::string& msg) const {
  out.clear();
  Stmt s(prepare("SELECT DISTINCT ns FROM kv ORDER BY ns;", msg));
  if (!s) return false;
  int rc;
  while ((rc = sqlite3_step(s.get())) == SQLITE_ROW) {
    const unsigned char* t = sqlite3_column_text(s.get(), 0);
    out.emplace_back(t ? reinterpret_cast<const char*>(t) : "");
  }
  if (rc != SQLITE_DONE) { msg = error("namespace scan failed"); return false; }
  return true;
}

bool KvStore::count(const std::string& ns, size_t& out, std::string& msg) const {
  Stmt s(prepare("SELECT COUNT(*) FROM kv WHERE ns = ?1;", msg));
  if (!s) return false;
  bind_text(s.get(), 1, ns);
  if (sqlite3_step(s.get()) != SQLITE_ROW) { msg = error("count failed"); return false; }
  out = static_cast<size_t>(sqlite3_column_int64(s.get(), 0));
  return true;
}

bool KvStore::commit(const WriteBatch& batch, std::string& msg) {
  if (batch.empty()) return true;
  if (!exec("BEGIN IMMEDIATE;", msg)) return false;
  Stmt put_s(prepare("INSERT OR REPLACE INTO kv(ns, key, value) VALUES(?1, ?2, ?3);", msg));
  Stmt del_s(prepare("DELETE FROM kv WHERE ns = ?1 AND key = ?2;", msg));
  Stmt drop_s(prepare("DELETE FROM kv WHERE ns = ?1;", msg));
  bool ok = put_s && del_s && drop_s;
  for (size_t i = 0; ok && i < batch.ops_.size(); ++i) {
    const WriteBatch::Op& op = batch.ops_[i];
    sqlite3_stmt* s = nullptr;
    switch (op.kind) {
      case WriteBatch::Op::Put:
        s = put_s.get();
        bind_text(s, 1, op.ns); bind_blob(s, 2, op.key); bind_blob(s, 3, op.value);
        break;
      case WriteBatch::Op::Del:
        s = del_s.get();
        bind_text(s, 1, op.ns); bind_blob(s, 2, op.key);
        break;
      case WriteBatch::Op::DelNamespace:
        s = drop_s.get();
        bind_text(s, 1, op.ns);
        break;
    }
    if (sqlite3_step(s) != SQLITE_DONE) { msg = error("write failed"); ok = false; }
    sqlite3_reset(s);
    sqlite3_clear_bindings(s);
  }
  if (ok && exec("COMMIT;", msg)) return true;
  std::string ignored;
  // rollback can only fail if the transaction is already gone; msg keeps the first error
  if (!exec("ROLLBACK;", ignored) && msg.empty()) msg = ignored;
  return false;
}

bool KvStore::checkpoint(std::string& msg) {
  int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
  if (rc != SQLITE_OK) { msg = error("checkpoint failed"); return false; }
  return true;
}

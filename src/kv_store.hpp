#pragma once
/*
 * KvStore
 *
 * Purpose: embedded, transactional, key-ordered byte store (SQLite file),
 * partitioned into namespaces (one per document for history).
 * Exclusivity: one writer per file. open() takes a flock on "<file>.lock";
 * a second open fails instead of sharing the file.
 * Errors: bool/GetResult return + human-readable msg.
 */
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "posix_fd.hpp"

struct sqlite3;
struct sqlite3_stmt;

/*Corrupt: present but undecodable (only returned by typed readers)*/
enum class GetResult { Found, Missing, Corrupt, Error };

class WriteBatch {
public:
  void put(std::string ns, std::string key, std::string value) {
    ops_.push_back(Op{Op::Put, std::move(ns), std::move(key), std::move(value)});
  }
  void del(std::string ns, std::string key) {
    ops_.push_back(Op{Op::Del, std::move(ns), std::move(key), {}});
  }
  void del_namespace(std::string ns) {
    ops_.push_back(Op{Op::DelNamespace, std::move(ns), {}, {}});
  }
  void append(const WriteBatch& other) { ops_.insert(ops_.end(), other.ops_.begin(), other.ops_.end()); }
  bool empty() const { return ops_.empty(); }
  size_t size() const { return ops_.size(); }
  void clear() { ops_.clear(); }

private:
  friend class KvStore;
  struct Op {
    enum Kind { Put, Del, DelNamespace } kind;
    std::string ns;
    std::string key;
    std::string value;
  };
  std::vector<Op> ops_;
};

class KvStore {
public:
  static std::unique_ptr<KvStore> open(const std::filesystem::path& file, std::string& msg);
  ~KvStore();
  KvStore(const KvStore&) = delete;
  KvStore& operator=(const KvStore&) = delete;

  const std::filesystem::path& path() const { return path_; }

  bool put(const std::string& ns, const std::string& key, const std::string& value, std::string& msg);
  GetResult get(const std::string& ns, const std::string& key, std::string& out, std::string& msg) const;
  /*deleting a missing key succeeds*/
  bool del(const std::string& ns, const std::string& key, std::string& msg);
  bool del_namespace(const std::string& ns, std::string& msg);

  /*keys of `ns` in ascending byte order*/
  bool keys(const std::string& ns, std::vector<std::string>& out, std::string& msg) const;
  bool namespaces(std::vector<std::string>& out, std::string& msg) const;
  bool count(const std::string& ns, size_t& out, std::string& msg) const;

  /*all or nothing*/
  bool commit(const WriteBatch& batch, std::string& msg);

  /*durability barrier: fold the WAL into the database file*/
  bool checkpoint(std::string& msg);

private:
  KvStore() = default;
  bool exec(const char* sql, std::string& msg);
  sqlite3_stmt* prepare(const char* sql, std::string& msg) const;
  std::string error(const char* what) const;

  std::filesystem::path path_;
  FileLock lock_;
  sqlite3* db_ = nullptr;
};

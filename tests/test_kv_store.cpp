#include "kv_store.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_basic(const TempDir& dir) {
  std::string msg;
  auto kv = KvStore::open(dir.path() / "nested" / "kv.db", msg);
  assert(kv);
  assert(kv->put("a", "k1", "v1", msg));
  assert(kv->put("a", "k0", std::string("\0x\0", 3), msg));
  assert(kv->put("b", "k1", "", msg));

  std::string out;
  assert(kv->get("a", "k1", out, msg) == GetResult::Found && out == "v1");
  assert(kv->get("a", "k0", out, msg) == GetResult::Found && out == std::string("\0x\0", 3));
  assert(kv->get("b", "k1", out, msg) == GetResult::Found && out.empty());
  assert(kv->get("c", "k1", out, msg) == GetResult::Missing);

  std::vector<std::string> keys;
  assert(kv->keys("a", keys, msg));
  assert((keys == std::vector<std::string>{"k0", "k1"}));
  std::vector<std::string> ns;
  assert(kv->namespaces(ns, msg));
  assert((ns == std::vector<std::string>{"a", "b"}));

  assert(kv->del("a", "k1", msg));
  assert(kv->del("a", "never-there", msg));
  size_t n = 0;
  assert(kv->count("a", n, msg) && n == 1);
  assert(kv->del_namespace("a", msg));
  assert(kv->count("a", n, msg) && n == 0);
  assert(kv->count("b", n, msg) && n == 1);
  assert(kv->checkpoint(msg));
}

static void test_batch(const TempDir& dir) {
  std::string msg;
  auto kv = KvStore::open(dir.path() / "batch.db", msg);
  assert(kv);
  WriteBatch b;
  b.put("d", "x", "1");
  b.put("d", "y", "2");
  b.del("d", "x");
  WriteBatch tail;
  tail.put("d", "z", "3");
  b.append(tail);
  assert(b.size() == 4);
  assert(kv->commit(b, msg));
  std::vector<std::string> keys;
  assert(kv->keys("d", keys, msg));
  assert((keys == std::vector<std::string>{"y", "z"}));
  assert(kv->commit(WriteBatch{}, msg));
}

static void test_reopen_and_lock(const TempDir& dir) {
  auto file = dir.path() / "lock.db";
  std::string msg;
  {
    auto kv = KvStore::open(file, msg);
    assert(kv);
    assert(kv->put("n", "k", "kept", msg));
    std::string err;
    auto second = KvStore::open(file, err);
    assert(!second);
    assert(err.find("locked") != std::string::npos);
  }
  auto kv = KvStore::open(file, msg);
  assert(kv);
  std::string out;
  assert(kv->get("n", "k", out, msg) == GetResult::Found && out == "kept");
}

int main() {
  TempDir dir;
  assert(dir.ok());
  test_basic(dir);
  test_batch(dir);
  test_reopen_and_lock(dir);
  return 0;
}

#include "doc_identity.hpp"
#include "config.hpp"
#include <cstdio>
#include <cstdlib>

uint64_t fnv1a64(std::string_view s) {
  uint64_t h = 0xcbf29ce484222325ULL;
  for (unsigned char c : s) {
    h ^= c;
    h *= 0x100000001b3ULL;
  }
  return h;
}

std::string doc_id_for_path(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::path canon = std::filesystem::canonical(path, ec);
  if (ec) canon = path;
  char hex[17];
  std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(fnv1a64(canon.generic_string())));
  return std::string("file-") + hex;
}

std::string IdGenerator::generate_unsaved_id() {
  return "unsaved-" + std::to_string(unsaved_++);
}

std::filesystem::path executable_dir() {
  std::error_code ec;
  auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec || !exe.has_parent_path()) return std::filesystem::path(".");
  return exe.parent_path();
}

std::filesystem::path resolve_data_dir() {
  const char* env = std::getenv(SCRIBE_DATA_DIR_ENV);
  if (env && *env) return std::filesystem::path(env);
  return executable_dir() / SCRIBE_DATA_DIR_NAME;
}

std::filesystem::path session_db_path() {
  return executable_dir() / SCRIBE_SESSION_DB;
}

#pragma once
/*
 * DocIdentity
 *
 * Purpose: stable keys for per-document history.
 *   file-backed: "file-" + 16 hex digits of FNV-1a(canonical path)
 *   unsaved:     "unsaved-N" from an IdGenerator owned by the caller
 * Note: unsaved ids are unique per generator only; the session store keeps
 * them across restarts.
 */
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

uint64_t fnv1a64(std::string_view s);

std::string doc_id_for_path(const std::filesystem::path& path);

class IdGenerator {
public:
  std::string generate_unsaved_id();
private:
  uint64_t unsaved_ = 0;
};

/*$SCRIBE_DATA_DIR, else <exe dir>/.data*/
std::filesystem::path resolve_data_dir();
std::filesystem::path session_db_path();
std::filesystem::path executable_dir();

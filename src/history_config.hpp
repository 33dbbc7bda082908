#pragma once
/*
 * HistoryConfig
 *
 * Purpose: runtime limits of the history engine and where it stores data.
 * Sources, later wins: built-in defaults → rc file (~/.scriberc) → $SCRIBE_DATA_DIR.
 * rc syntax: one command per line, e.g. "set hotcapacity 200" or ":set maxdepth=5000".
 */
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include "config.hpp"

struct HistoryConfig {
  size_t hot_capacity = SCRIBE_DEFAULT_HOT_CAPACITY;
  size_t max_history_depth = SCRIBE_DEFAULT_MAX_HISTORY_DEPTH;
  std::chrono::milliseconds group_timeout{SCRIBE_DEFAULT_GROUP_TIMEOUT_MS};
  std::filesystem::path data_dir;

  /*built-in limits plus the resolved data directory*/
  static HistoryConfig defaults();
};

std::filesystem::path default_rc_path();

/*
 * Applies every valid line of `rc_path` to `cfg`. A missing file is not an error.
 * Returns false if any line was rejected; msg then lists the rejected lines.
 */
bool load_history_config(const std::filesystem::path& rc_path, HistoryConfig& cfg, std::string& msg);

void apply_env_overrides(HistoryConfig& cfg);

std::string describe(const HistoryConfig& cfg);

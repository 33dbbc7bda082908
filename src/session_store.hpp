#pragma once
/*
 * SessionStore
 *
 * Purpose: remembers which tabs were open and the text of unsaved buffers,
 * in its own KvStore file (see session_db_path()).
 *   ns "session": "data" → encoded SessionData
 *   ns "content": session id → raw text (any bytes, NUL included)
 * Note: content is keyed by the UnsavedTab session_id; it is not removed
 * automatically when a tab disappears from SessionData.
 */
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "kv_store.hpp"

struct FileTab {
  std::string path;
  bool operator==(const FileTab&) const = default;
};

struct UnsavedTab {
  std::string session_id;
  std::string title;
  bool operator==(const UnsavedTab&) const = default;
};

using TabEntry = std::variant<FileTab, UnsavedTab>;

struct SessionData {
  std::vector<TabEntry> tabs;
  uint64_t active_tab_index = 0;
  bool operator==(const SessionData&) const = default;
};

std::string encode_session(const SessionData& s);
bool decode_session(const std::string& bytes, SessionData& s);

class SessionStore {
public:
  static std::unique_ptr<SessionStore> open(const std::filesystem::path& file, std::string& msg);

  bool save_session(const SessionData& data, std::string& msg);
  /*Missing when nothing was ever saved; an undecodable value is an Error*/
  GetResult load_session(SessionData& out, std::string& msg) const;

  bool save_content(const std::string& id, const std::string& text, std::string& msg);
  GetResult load_content(const std::string& id, std::string& out, std::string& msg) const;
  bool delete_content(const std::string& id, std::string& msg);
  bool clear_all_content(std::string& msg);
  bool list_content_ids(std::vector<std::string>& out, std::string& msg) const;

  const std::filesystem::path& path() const { return kv_->path(); }

private:
  explicit SessionStore(std::unique_ptr<KvStore> kv) : kv_(std::move(kv)) {}
  std::unique_ptr<KvStore> kv_;
};

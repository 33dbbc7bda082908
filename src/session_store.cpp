#include "session_store.hpp"
#include "codec.hpp"
#include "config.hpp"
#include <utility>

static const char* const kSessionNs = "session";
static const char* const kSessionKey = "data";
static const char* const kContentNs = "content";

enum : uint8_t { kTagFile = 0, kTagUnsaved = 1 };

std::string encode_session(const SessionData& s) {
  ByteWriter w;
  w.u8(SCRIBE_CODEC_VERSION);
  w.u32(static_cast<uint32_t>(s.tabs.size()));
  for (const auto& tab : s.tabs) {
    if (const auto* f = std::get_if<FileTab>(&tab)) {
      w.u8(kTagFile);
      w.str(f->path);
    } else {
      const auto& u = std::get<UnsavedTab>(tab);
      w.u8(kTagUnsaved);
      w.str(u.session_id);
      w.str(u.title);
    }
  }
  w.u64(s.active_tab_index);
  return w.take();
}

bool decode_session(const std::string& bytes, SessionData& s) {
  ByteReader r(bytes);
  uint8_t version = 0;
  uint32_t n = 0;
  if (!r.u8(version) || version != SCRIBE_CODEC_VERSION || !r.u32(n)) return false;
  // each tab takes at least a tag byte and one length prefix
  if (n > bytes.size() / 9) return false;
  SessionData out;
  out.tabs.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    uint8_t tag = 0;
    if (!r.u8(tag)) return false;
    if (tag == kTagFile) {
      FileTab f;
      if (!r.str(f.path)) return false;
      out.tabs.emplace_back(std::move(f));
    } else if (tag == kTagUnsaved) {
      UnsavedTab u;
      if (!r.str(u.session_id) || !r.str(u.title)) return false;
      out.tabs.emplace_back(std::move(u));
    } else {
      return false;
    }
  }
  if (!r.u64(out.active_tab_index) || !r.at_end()) return false;
  s = std::move(out);
  return true;
}

std::unique_ptr<SessionStore> SessionStore::open(const std::filesystem::path& file, std::string& msg) {
  auto kv = KvStore::open(file, msg);
  if (!kv) return nullptr;
  return std::unique_ptr<SessionStore>(new SessionStore(std::move(kv)));
}

bool SessionStore::save_session(const SessionData& data, std::string& msg) {
  return kv_->put(kSessionNs, kSessionKey, encode_session(data), msg);
}

GetResult SessionStore::load_session(SessionData& out, std::string& msg) const {
  std::string bytes;
  GetResult r = kv_->get(kSessionNs, kSessionKey, bytes, msg);
  if (r != GetResult::Found) return r;
  if (!decode_session(bytes, out)) {
    msg = kv_->path().string() + ": saved session is corrupt";
    return GetResult::Error;
  }
  return GetResult::Found;
}

bool SessionStore::save_content(const std::string& id, const std::string& text, std::string& msg) {
  return kv_->put(kContentNs, id, text, msg);
}

GetResult SessionStore::load_content(const std::string& id, std::string& out, std::string& msg) const {
  return kv_->get(kContentNs, id, out, msg);
}

bool SessionStore::delete_content(const std::string& id, std::string& msg) {
  return kv_->del(kContentNs, id, msg);
}

bool SessionStore::clear_all_content(std::string& msg) {
  return kv_->del_namespace(kContentNs, msg);
}

bool SessionStore::list_content_ids(std::vector<std::string>& out, std::string& msg) const {
  return kv_->keys(kContentNs, out, msg);
}

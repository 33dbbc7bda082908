#include "edit_model.hpp"

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

size_t utf8_length(std::string_view s) {
  size_t n = 0;
  for (unsigned char c : s) if (!is_continuation(c)) n++;
  return n;
}

size_t utf8_byte_offset(std::string_view s, uint64_t cp) {
  uint64_t seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
    if (seen == cp) return i;
    seen++;
  }
  return seen == cp ? s.size() : std::string_view::npos;
}

EditOperation EditOperation::reversed() const {
  EditOperation r;
  r.position = position;
  r.inserted = deleted;
  r.deleted = inserted;
  r.cursor_before = cursor_after;
  r.cursor_after = cursor_before;
  return r;
}

EditKind classify(const EditOperation& op) {
  if (op.deleted.empty() && utf8_length(op.inserted) == 1) return EditKind::InsertChar;
  if (op.inserted.empty() && utf8_length(op.deleted) == 1) return EditKind::DeleteChar;
  return EditKind::Other;
}

// replace `from` with `to` at code point `pos`; untouched text on mismatch
static bool replace_at(std::string& text, uint64_t pos, const std::string& from, const std::string& to) {
  size_t at = utf8_byte_offset(text, pos);
  if (at == std::string_view::npos) return false;
  if (text.compare(at, from.size(), from) != 0) return false;
  text.replace(at, from.size(), to);
  return true;
}

bool apply_forward(std::string& text, const EditOperation& op) {
  return replace_at(text, op.position, op.deleted, op.inserted);
}

bool apply_reverse(std::string& text, const EditOperation& op) {
  return replace_at(text, op.position, op.inserted, op.deleted);
}

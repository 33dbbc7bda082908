#include "codec.hpp"
#include "config.hpp"
#include <utility>

void ByteWriter::u32(uint32_t v) {
  for (int i = 0; i < 4; ++i) out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void ByteWriter::u64(uint64_t v) {
  for (int i = 0; i < 8; ++i) out_.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

void ByteWriter::str(std::string_view s) {
  u64(static_cast<uint64_t>(s.size()));
  out_.append(s.data(), s.size());
}

bool ByteReader::u8(uint8_t& v) {
  if (!need(1)) return false;
  v = static_cast<uint8_t>(in_[pos_++]);
  return true;
}

bool ByteReader::u32(uint32_t& v) {
  if (!need(4)) return false;
  v = 0;
  for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(static_cast<unsigned char>(in_[pos_ + i])) << (8 * i);
  pos_ += 4;
  return true;
}

bool ByteReader::u64(uint64_t& v) {
  if (!need(8)) return false;
  v = 0;
  for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(static_cast<unsigned char>(in_[pos_ + i])) << (8 * i);
  pos_ += 8;
  return true;
}

bool ByteReader::str(std::string& s) {
  uint64_t n = 0;
  if (!u64(n)) return false;
  if (n > in_.size() - pos_) return false;
  s.assign(in_.data() + pos_, static_cast<size_t>(n));
  pos_ += static_cast<size_t>(n);
  return true;
}

static void put_cursor(ByteWriter& w, const CursorSnapshot& c) { w.u64(c.line); w.u64(c.col); }
static bool get_cursor(ByteReader& r, CursorSnapshot& c) { return r.u64(c.line) && r.u64(c.col); }

std::string encode_group(const EditGroup& g) {
  ByteWriter w;
  w.u8(SCRIBE_CODEC_VERSION);
  w.u64(g.seq);
  w.u32(static_cast<uint32_t>(g.operations.size()));
  for (const auto& op : g.operations) {
    w.u64(op.position);
    w.str(op.inserted);
    w.str(op.deleted);
    put_cursor(w, op.cursor_before);
    put_cursor(w, op.cursor_after);
  }
  return w.take();
}

bool decode_group(std::string_view bytes, EditGroup& g) {
  ByteReader r(bytes);
  uint8_t ver = 0;
  if (!r.u8(ver) || ver != SCRIBE_CODEC_VERSION) return false;
  EditGroup out;
  uint32_t n = 0;
  if (!r.u64(out.seq) || !r.u32(n)) return false;
  // each op needs at least 56 bytes; guards reserve() against garbage counts
  if (n > bytes.size() / 56) return false;
  out.operations.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    EditOperation op;
    if (!r.u64(op.position) || !r.str(op.inserted) || !r.str(op.deleted)) return false;
    if (!get_cursor(r, op.cursor_before) || !get_cursor(r, op.cursor_after)) return false;
    out.operations.push_back(std::move(op));
  }
  if (!r.at_end()) return false;
  g = std::move(out);
  return true;
}

std::string encode_meta(const HistoryMeta& m) {
  ByteWriter w;
  w.u8(SCRIBE_CODEC_VERSION);
  w.u64(m.next_seq);
  w.u64(m.undo_cursor);
  return w.take();
}

bool decode_meta(std::string_view bytes, HistoryMeta& m) {
  ByteReader r(bytes);
  uint8_t ver = 0;
  HistoryMeta out;
  if (!r.u8(ver) || ver != SCRIBE_CODEC_VERSION) return false;
  if (!r.u64(out.next_seq) || !r.u64(out.undo_cursor) || !r.at_end()) return false;
  m = out;
  return true;
}

std::string encode_ordered_u64(uint64_t v) {
  std::string s(8, '\0');
  for (int i = 7; i >= 0; --i) { s[i] = static_cast<char>(v & 0xFF); v >>= 8; }
  return s;
}

bool decode_ordered_u64(std::string_view bytes, uint64_t& v) {
  if (bytes.size() != 8) return false;
  v = 0;
  for (unsigned char c : bytes) v = (v << 8) | c;
  return true;
}

#pragma once
/*
 * Codec
 *
 * Purpose: compact binary encoding of stored values (groups, history meta).
 * Format: version byte, then little-endian fixed-width ints and
 * length-prefixed strings. Decoders reject truncated or trailing bytes.
 */
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include "edit_model.hpp"

class ByteWriter {
public:
  void u8(uint8_t v) { out_.push_back(static_cast<char>(v)); }
  void u32(uint32_t v);
  void u64(uint64_t v);
  void str(std::string_view s);
  const std::string& bytes() const { return out_; }
  std::string take() { return std::move(out_); }
private:
  std::string out_;
};

class ByteReader {
public:
  explicit ByteReader(std::string_view in) : in_(in) {}
  bool u8(uint8_t& v);
  bool u32(uint32_t& v);
  bool u64(uint64_t& v);
  bool str(std::string& s);
  bool at_end() const { return pos_ == in_.size(); }
private:
  bool need(size_t n) const { return in_.size() - pos_ >= n; }
  std::string_view in_;
  size_t pos_ = 0;
};

struct HistoryMeta {
  uint64_t next_seq = 0;
  uint64_t undo_cursor = 0;
  bool operator==(const HistoryMeta&) const = default;
};

std::string encode_group(const EditGroup& g);
bool decode_group(std::string_view bytes, EditGroup& g);

std::string encode_meta(const HistoryMeta& m);
bool decode_meta(std::string_view bytes, HistoryMeta& m);

/*8-byte big-endian, so byte order == numeric order*/
std::string encode_ordered_u64(uint64_t v);
bool decode_ordered_u64(std::string_view bytes, uint64_t& v);

#pragma once
/*
 * EditModel
 *
 * Purpose: one atomic change (EditOperation) and one undo step (EditGroup).
 * Positions are code point offsets into the document's UTF-8 text.
 * Invariant: apply_forward then apply_reverse of the same op is the identity.
 */
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"

struct EditOperation {
  uint64_t position = 0;
  std::string inserted;
  std::string deleted;
  CursorSnapshot cursor_before;
  CursorSnapshot cursor_after;

  EditOperation reversed() const;
  bool operator==(const EditOperation&) const = default;
};

struct EditGroup {
  std::vector<EditOperation> operations;
  uint64_t seq = 0;

  bool operator==(const EditGroup&) const = default;
};

enum class EditKind { InsertChar, DeleteChar, Other };

EditKind classify(const EditOperation& op);

size_t utf8_length(std::string_view s);
/*byte offset of code point `cp`, npos when past the end*/
size_t utf8_byte_offset(std::string_view s, uint64_t cp);

bool apply_forward(std::string& text, const EditOperation& op);
bool apply_reverse(std::string& text, const EditOperation& op);

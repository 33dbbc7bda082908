#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight value types (CursorSnapshot).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstdint>

struct CursorSnapshot {
  uint64_t line = 0;
  uint64_t col = 0;
  bool operator==(const CursorSnapshot&) const = default;
};

#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (ids, Rect, line-number mode).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

enum class Mode { Normal, Command };

enum class LineNumberMode { Absolute, Relative };

struct ViewId { size_t value = 0; };
struct DocumentId { size_t value = 0; };

inline bool operator==(ViewId a, ViewId b) { return a.value == b.value; }
inline bool operator==(DocumentId a, DocumentId b) { return a.value == b.value; }
inline bool operator<(ViewId a, ViewId b) { return a.value < b.value; }

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

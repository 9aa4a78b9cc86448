#pragma once
/*
 * View
 *
 * Purpose: a window onto one document: screen area + first visible line.
 * Note: the gutter reads last_line() to decide where the `~` marker goes.
 */
#include <cstddef>
#include "types.hpp"
#include "document.hpp"

struct View {
  ViewId id;
  DocumentId doc;
  Rect area{};
  size_t offset = 0;  // first visible document line

  size_t inner_height() const { return area.height > 0 ? static_cast<size_t>(area.height) : 0; }
  size_t last_line(const Document& d) const;
  // scroll so the primary cursor line is visible
  void ensure_cursor_in_view(const Document& d);
};

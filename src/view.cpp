#include "view.hpp"
#include <algorithm>

size_t View::last_line(const Document& d) const {
  size_t height = std::max<size_t>(1, inner_height());
  size_t last_doc_line = d.text().len_lines() - 1;
  return std::min(offset + height - 1, last_doc_line);
}

void View::ensure_cursor_in_view(const Document& d) {
  const TextBuffer& text = d.text();
  size_t row = text.byte_to_line(d.selection(id).primary().cursor(text));
  size_t height = std::max<size_t>(1, inner_height());
  if (row < offset) offset = row;
  if (row >= offset + height) offset = row - height + 1;
}

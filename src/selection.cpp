#include "selection.hpp"
#include <algorithm>
#include <glog/logging.h>

static inline bool is_utf8_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

size_t Range::cursor(const TextBuffer& text) const {
  size_t len = text.len_bytes();
  size_t h = std::min(head, len);
  if (anchor >= head || h == 0) return h;
  std::string_view s = text.str();
  size_t p = h - 1;
  while (p > 0 && is_utf8_continuation(static_cast<unsigned char>(s[p]))) p--;
  return p;
}

Selection::Selection(std::vector<Range> ranges, size_t primary)
  : ranges_(std::move(ranges)), primary_(primary) {
  CHECK(!ranges_.empty()) << "selection needs at least one range";
  CHECK_LT(primary_, ranges_.size());
}

std::set<size_t> Selection::cursor_lines(const TextBuffer& text) const {
  std::set<size_t> lines;
  for (const auto& r : ranges_) lines.insert(text.byte_to_line(r.cursor(text)));
  return lines;
}

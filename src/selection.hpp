#pragma once
/*
 * Selection
 *
 * Purpose: per-view set of byte ranges with one primary range.
 * Note: a range's cursor is its head, except for a forward (anchor < head)
 *       range where the cursor sits on the character before head.
 */
#include <cstddef>
#include <set>
#include <vector>
#include "text_buffer.hpp"

struct Range {
  size_t anchor = 0;
  size_t head = 0;

  static Range point(size_t pos) { return Range{pos, pos}; }
  size_t cursor(const TextBuffer& text) const;
};

class Selection {
public:
  Selection() : ranges_{Range{}} {}
  explicit Selection(Range r) : ranges_{r} {}
  Selection(std::vector<Range> ranges, size_t primary);

  static Selection point(size_t pos) { return Selection(Range::point(pos)); }

  const Range& primary() const { return ranges_[primary_]; }
  size_t primary_index() const { return primary_; }
  const std::vector<Range>& ranges() const { return ranges_; }

  // lines holding the cursor of any range
  std::set<size_t> cursor_lines(const TextBuffer& text) const;

private:
  std::vector<Range> ranges_;
  size_t primary_ = 0;
};

#pragma once
/*
 * LineIndex
 *
 * Purpose: byte offsets of line starts, stored in fixed-size blocks.
 * Note: a text of N newlines has N+1 lines; the last may be empty.
 */
#include <vector>
#include <cstddef>
#include <string_view>

struct LineBlock {
  size_t base_offset;
  std::vector<size_t> rel;
};

class LineIndex {
public:
  std::vector<LineBlock> blocks;
  size_t block_size = 1024;

  void build_from_text(std::string_view text);
  size_t line_count() const;
  size_t line_start(size_t row) const;
  size_t line_of_byte(size_t byte) const;
};

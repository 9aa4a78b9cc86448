#include "line_index.hpp"
#include <algorithm>

void LineIndex::build_from_text(std::string_view text) {
  blocks.clear();
  std::vector<size_t> starts;
  starts.push_back(0);
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') starts.push_back(i + 1);
  }
  size_t n = starts.size();
  for (size_t i = 0; i < n; i += block_size) {
    size_t end = std::min(n, i + block_size);
    LineBlock b;
    b.base_offset = starts[i];
    b.rel.reserve(end - i);
    for (size_t k = i; k < end; ++k) b.rel.push_back(starts[k] - b.base_offset);
    blocks.push_back(std::move(b));
  }
}

size_t LineIndex::line_count() const { size_t c = 0; for (const auto& b : blocks) c += b.rel.size(); return c; }

size_t LineIndex::line_start(size_t row) const {
  if (blocks.empty()) return 0;
  size_t acc = 0;
  for (const auto& b : blocks) {
    if (row < acc + b.rel.size()) {
      size_t idx = row - acc;
      return b.base_offset + b.rel[idx];
    }
    acc += b.rel.size();
  }
  return blocks.back().base_offset + blocks.back().rel.back();
}

size_t LineIndex::line_of_byte(size_t byte) const {
  if (blocks.empty()) return 0;
  // last block whose first line starts at or before `byte`
  auto bit = std::upper_bound(blocks.begin(), blocks.end(), byte,
                              [](size_t v, const LineBlock& b) { return v < b.base_offset; });
  if (bit != blocks.begin()) --bit;
  size_t acc = 0;
  for (auto it = blocks.begin(); it != bit; ++it) acc += it->rel.size();
  size_t rel = byte - bit->base_offset;
  auto rit = std::upper_bound(bit->rel.begin(), bit->rel.end(), rel);
  size_t idx = static_cast<size_t>(rit - bit->rel.begin());
  return acc + (idx > 0 ? idx - 1 : 0);
}

#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows > 0 ? rows : 1), cols_(cols > 0 ? cols : 1),
    grid_(static_cast<size_t>(rows_ * cols_)) {}

void HeadlessTerminal::clear() {
  for (auto& c : grid_) c = Cell{};
}

void HeadlessTerminal::put(int row, int col, const std::string& text, const Style& style) {
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    size_t len = 1;
    unsigned char lead = static_cast<unsigned char>(text[i]);
    if (lead >= 0xF0) len = 4;
    else if (lead >= 0xE0) len = 3;
    else if (lead >= 0xC0) len = 2;
    if (col >= 0) {
      Cell& c = grid_[static_cast<size_t>(row * cols_ + col)];
      c.glyph = text.substr(i, len);
      c.style = style;
    }
    i += len;
    col++;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, Style{}); }

void HeadlessTerminal::draw_styled(int row, int col, const std::string& text, const Style& style) {
  put(row, col, text, style);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) grid_[static_cast<size_t>(row * cols_ + c)] = Cell{};
}

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return -1;
  int k = keys_.front();
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (unsigned char ch : keys) keys_.push_back(ch);
}

std::string HeadlessTerminal::text_at(int row, int col, int len) const {
  std::string out;
  for (int c = col; c < col + len && c < cols_; ++c) out += cell(row, c).glyph;
  return out;
}

std::string HeadlessTerminal::row_text(int row) const {
  std::string out = text_at(row, 0, cols_);
  size_t end = out.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : out.substr(0, end + 1);
}

std::string HeadlessTerminal::dump() const {
  std::string out;
  for (int r = 0; r < rows_; ++r) { out += row_text(r); out.push_back('\n'); }
  return out;
}

#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal; records every cell (glyph + style) so tests
 *          and `--dump` can inspect a rendered frame.
 * Input: keys queued with push_keys() are returned by read_key(), then -1.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell {
    std::string glyph = " ";
    Style style;
  };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, const Style& style) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refresh_count_++; }
  void clear_to_eol(int row, int col) override;
  int read_key() override;

  void push_keys(const std::string& keys);
  void push_key(int key) { keys_.push_back(key); }

  const Cell& cell(int row, int col) const { return grid_[static_cast<size_t>(row * cols_ + col)]; }
  // row text with trailing blanks removed
  std::string row_text(int row) const;
  // cells [col, col+len) concatenated, blanks kept
  std::string text_at(int row, int col, int len) const;
  std::string dump() const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text, const Style& style);

  int rows_;
  int cols_;
  std::vector<Cell> grid_;
  std::deque<int> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};

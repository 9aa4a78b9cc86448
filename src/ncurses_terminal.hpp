#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input.
 * Styles: modifiers map to A_* attributes; colors map to the nearest entry of
 *         the terminal palette (8/16/256) and share lazily created pairs.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <map>
#include <utility>
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override = default;
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, const Style& style) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  int read_key() override;

private:
  short color_index(const std::optional<Color>& c) const;
  short pair_for(short fg, short bg);
  attr_t attrs_for(const Style& style);

  bool colors_ = false;
  std::map<std::pair<short, short>, short> pairs_;
  short next_pair_ = 1;
};

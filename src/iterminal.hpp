#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Note: text is UTF-8; one code point occupies one cell.
 */
#include <string>
#include "style.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_styled(int row, int col, const std::string& text, const Style& style) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // next key code, or -1 when no more input will arrive
  virtual int read_key() = 0;
};

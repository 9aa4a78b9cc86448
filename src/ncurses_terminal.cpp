#include "ncurses_terminal.hpp"
#include <algorithm>
#include <glog/logging.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    use_default_colors();
    colors_ = true;
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddstr(row, col, text.c_str());
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, const Style& style) {
  attr_t a = attrs_for(style);
  attron(a);
  mvaddstr(row, col, text.c_str());
  attroff(a);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() {
  int ch = getch();
  return ch == ERR ? -1 : ch;
}

static short cube_level(uint8_t v) { return static_cast<short>((v * 5 + 127) / 255); }

short NcursesTerminal::color_index(const std::optional<Color>& c) const {
  if (!c) return -1;
  bool bright = COLORS >= 16;
  switch (c->kind) {
    case Color::Kind::Reset: return -1;
    case Color::Kind::Black: return COLOR_BLACK;
    case Color::Kind::Red: return COLOR_RED;
    case Color::Kind::Green: return COLOR_GREEN;
    case Color::Kind::Yellow: return COLOR_YELLOW;
    case Color::Kind::Blue: return COLOR_BLUE;
    case Color::Kind::Magenta: return COLOR_MAGENTA;
    case Color::Kind::Cyan: return COLOR_CYAN;
    case Color::Kind::LightGray: return COLOR_WHITE;
    case Color::Kind::Gray: return bright ? 8 : COLOR_WHITE;
    case Color::Kind::LightRed: return bright ? 9 : COLOR_RED;
    case Color::Kind::LightGreen: return bright ? 10 : COLOR_GREEN;
    case Color::Kind::LightYellow: return bright ? 11 : COLOR_YELLOW;
    case Color::Kind::LightBlue: return bright ? 12 : COLOR_BLUE;
    case Color::Kind::LightMagenta: return bright ? 13 : COLOR_MAGENTA;
    case Color::Kind::LightCyan: return bright ? 14 : COLOR_CYAN;
    case Color::Kind::White: return bright ? 15 : COLOR_WHITE;
    case Color::Kind::Indexed: return c->index < COLORS ? c->index : static_cast<short>(c->index % 8);
    case Color::Kind::Rgb:
      if (COLORS >= 256) return static_cast<short>(16 + 36 * cube_level(c->r) + 6 * cube_level(c->g) + cube_level(c->b));
      // 8 colors: one bit per channel
      return static_cast<short>((c->r >= 128 ? 1 : 0) | (c->g >= 128 ? 2 : 0) | (c->b >= 128 ? 4 : 0));
  }
  return -1;
}

short NcursesTerminal::pair_for(short fg, short bg) {
  if (fg == -1 && bg == -1) return 0;
  auto key = std::make_pair(fg, bg);
  if (auto it = pairs_.find(key); it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) {
    LOG(WARNING) << "out of color pairs (" << COLOR_PAIRS << "), drawing with default colors";
    return 0;
  }
  short id = next_pair_++;
  init_pair(id, fg, bg);
  pairs_.emplace(key, id);
  return id;
}

attr_t NcursesTerminal::attrs_for(const Style& style) {
  attr_t a = A_NORMAL;
  uint16_t m = style.add_modifier & static_cast<uint16_t>(~style.sub_modifier);
  if (m & MOD_BOLD) a |= A_BOLD;
  if (m & MOD_DIM) a |= A_DIM;
  if (m & MOD_ITALIC) a |= A_ITALIC;
  if (m & MOD_UNDERLINED) a |= A_UNDERLINE;
  if (m & (MOD_SLOW_BLINK | MOD_RAPID_BLINK)) a |= A_BLINK;
  if (m & MOD_REVERSED) a |= A_REVERSE;
  if (m & MOD_HIDDEN) a |= A_INVIS;
  if (colors_) {
    short pair = pair_for(color_index(style.fg), color_index(style.bg));
    if (pair > 0) a |= COLOR_PAIR(pair);
  }
  return a;
}

#pragma once
/*
 * Style
 *
 * Purpose: terminal-agnostic visual style (fg/bg color + modifier bits).
 * Note: fg/bg are optional; an unset color inherits from whatever the style
 *       is patched onto. add/sub modifiers are applied in that order.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct Color {
  enum class Kind {
    Reset, Black, Red, Green, Yellow, Blue, Magenta, Cyan, Gray,
    LightRed, LightGreen, LightYellow, LightBlue, LightMagenta, LightCyan,
    LightGray, White, Rgb, Indexed
  };
  Kind kind = Kind::Reset;
  uint8_t r = 0, g = 0, b = 0;
  uint8_t index = 0;

  static Color named(Kind k) { Color c; c.kind = k; return c; }
  static Color rgb(uint8_t r, uint8_t g, uint8_t b) { Color c; c.kind = Kind::Rgb; c.r = r; c.g = g; c.b = b; return c; }
  static Color indexed(uint8_t i) { Color c; c.kind = Kind::Indexed; c.index = i; return c; }

  bool operator==(const Color& o) const;
};

/* bit set, same layout as the usual terminal SGR modifiers */
enum Modifier : uint16_t {
  MOD_NONE        = 0,
  MOD_BOLD        = 1 << 0,
  MOD_DIM         = 1 << 1,
  MOD_ITALIC      = 1 << 2,
  MOD_UNDERLINED  = 1 << 3,
  MOD_SLOW_BLINK  = 1 << 4,
  MOD_RAPID_BLINK = 1 << 5,
  MOD_REVERSED    = 1 << 6,
  MOD_HIDDEN      = 1 << 7,
  MOD_CROSSED_OUT = 1 << 8,
};

struct Style {
  std::optional<Color> fg;
  std::optional<Color> bg;
  uint16_t add_modifier = MOD_NONE;
  uint16_t sub_modifier = MOD_NONE;

  Style with_fg(Color c) const { Style s = *this; s.fg = c; return s; }
  Style with_bg(Color c) const { Style s = *this; s.bg = c; return s; }
  Style with_modifier(uint16_t m) const;
  Style without_modifier(uint16_t m) const;
  // Layer `other` over this style: set colors win, modifiers accumulate.
  Style patch(const Style& other) const;

  bool operator==(const Style& o) const;
};

/* "red", "lightblue", "#rrggbb", "0".."255" */
std::optional<Color> parse_color(std::string_view s);
std::optional<uint16_t> parse_modifier(std::string_view s);
std::string color_name(const Color& c);

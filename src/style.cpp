#include "style.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <utility>

namespace {
struct NamedColor { std::string_view name; Color::Kind kind; };

constexpr std::array<NamedColor, 17> kNamedColors{{
  {"reset", Color::Kind::Reset},
  {"black", Color::Kind::Black},
  {"red", Color::Kind::Red},
  {"green", Color::Kind::Green},
  {"yellow", Color::Kind::Yellow},
  {"blue", Color::Kind::Blue},
  {"magenta", Color::Kind::Magenta},
  {"cyan", Color::Kind::Cyan},
  {"gray", Color::Kind::Gray},
  {"lightred", Color::Kind::LightRed},
  {"lightgreen", Color::Kind::LightGreen},
  {"lightyellow", Color::Kind::LightYellow},
  {"lightblue", Color::Kind::LightBlue},
  {"lightmagenta", Color::Kind::LightMagenta},
  {"lightcyan", Color::Kind::LightCyan},
  {"lightgray", Color::Kind::LightGray},
  {"white", Color::Kind::White},
}};

constexpr std::array<std::pair<std::string_view, uint16_t>, 9> kModifiers{{
  {"bold", MOD_BOLD},
  {"dim", MOD_DIM},
  {"italic", MOD_ITALIC},
  {"underlined", MOD_UNDERLINED},
  {"slow_blink", MOD_SLOW_BLINK},
  {"rapid_blink", MOD_RAPID_BLINK},
  {"reversed", MOD_REVERSED},
  {"hidden", MOD_HIDDEN},
  {"crossed_out", MOD_CROSSED_OUT},
}};

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}
}

bool Color::operator==(const Color& o) const {
  if (kind != o.kind) return false;
  if (kind == Kind::Rgb) return r == o.r && g == o.g && b == o.b;
  if (kind == Kind::Indexed) return index == o.index;
  return true;
}

Style Style::with_modifier(uint16_t m) const {
  Style s = *this;
  s.add_modifier |= m;
  s.sub_modifier &= static_cast<uint16_t>(~m);
  return s;
}

Style Style::without_modifier(uint16_t m) const {
  Style s = *this;
  s.sub_modifier |= m;
  s.add_modifier &= static_cast<uint16_t>(~m);
  return s;
}

Style Style::patch(const Style& other) const {
  Style s = *this;
  if (other.fg) s.fg = other.fg;
  if (other.bg) s.bg = other.bg;
  s.add_modifier = static_cast<uint16_t>((s.add_modifier & ~other.sub_modifier) | other.add_modifier);
  s.sub_modifier = static_cast<uint16_t>((s.sub_modifier & ~other.add_modifier) | other.sub_modifier);
  return s;
}

bool Style::operator==(const Style& o) const {
  return fg == o.fg && bg == o.bg && add_modifier == o.add_modifier && sub_modifier == o.sub_modifier;
}

std::optional<Color> parse_color(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (s[0] == '#') {
    if (s.size() != 7) return std::nullopt;
    uint8_t ch[3];
    for (int i = 0; i < 3; ++i) {
      int hi = hex_value(s[1 + i * 2]);
      int lo = hex_value(s[2 + i * 2]);
      if (hi < 0 || lo < 0) return std::nullopt;
      ch[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color::rgb(ch[0], ch[1], ch[2]);
  }
  if (std::isdigit(static_cast<unsigned char>(s[0])) != 0) {
    unsigned v = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || p != s.data() + s.size() || v > 255) return std::nullopt;
    return Color::indexed(static_cast<uint8_t>(v));
  }
  for (const auto& nc : kNamedColors) {
    if (nc.name == s) return Color::named(nc.kind);
  }
  return std::nullopt;
}

std::optional<uint16_t> parse_modifier(std::string_view s) {
  for (const auto& [name, bit] : kModifiers) {
    if (name == s) return bit;
  }
  return std::nullopt;
}

std::string color_name(const Color& c) {
  if (c.kind == Color::Kind::Rgb) {
    static const char* digits = "0123456789abcdef";
    std::string out = "#";
    for (uint8_t v : {c.r, c.g, c.b}) { out.push_back(digits[v >> 4]); out.push_back(digits[v & 0xf]); }
    return out;
  }
  if (c.kind == Color::Kind::Indexed) return std::to_string(c.index);
  for (const auto& nc : kNamedColors) {
    if (nc.kind == c.kind) return std::string(nc.name);
  }
  return "reset";
}

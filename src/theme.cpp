#include "theme.hpp"
#include "bind_error.hpp"

Theme Theme::builtin() {
  Theme t;
  t.set("ui.text", Style{});
  t.set("ui.gutter", Style{});
  t.set("ui.linenr", Style{}.with_fg(Color::named(Color::Kind::Gray)));
  t.set("ui.linenr.selected", Style{}.with_fg(Color::named(Color::Kind::White)).with_modifier(MOD_BOLD));
  t.set("ui.statusline", Style{}.with_modifier(MOD_REVERSED));
  t.set("error", Style{}.with_fg(Color::rgb(0xe0, 0x6c, 0x75)));
  t.set("warning", Style{}.with_fg(Color::rgb(0xe5, 0xc0, 0x7b)));
  t.set("info", Style{}.with_fg(Color::rgb(0x61, 0xaf, 0xef)));
  t.set("hint", Style{}.with_fg(Color::rgb(0x56, 0xb6, 0xc2)));
  return t;
}

std::optional<Style> Theme::try_get(std::string_view scope) const {
  std::string key(scope);
  while (true) {
    if (auto it = styles_.find(key); it != styles_.end()) return it->second;
    size_t dot = key.rfind('.');
    if (dot == std::string::npos) return std::nullopt;
    key.resize(dot);
  }
}

Style Theme::get(std::string_view scope) const {
  if (auto s = try_get(scope)) return *s;
  throw MissingStyleError(std::string(scope));
}

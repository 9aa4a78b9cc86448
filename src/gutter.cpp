#include "gutter.hpp"
#include <algorithm>
#include <cmath>
#include <glog/logging.h>
#include "bind_error.hpp"
#include "editor.hpp"

static void right_align(std::string& out, std::string_view s, size_t width) {
  size_t w = display_width(s);
  if (w < width) out.append(width - w, ' ');
  out.append(s);
}

static inline size_t abs_diff(size_t a, size_t b) { return a > b ? a - b : b - a; }

static uint8_t fade_channel(uint8_t c) {
  return static_cast<uint8_t>(std::floor(static_cast<float>(c) * 0.4f));
}

GutterFn diagnostic(const Editor&, const Document& doc, const View&,
                    const Theme& theme, bool, size_t) {
  Style warning = theme.get("warning");
  Style error = theme.get("error");
  Style info = theme.get("info");
  Style hint = theme.get("hint");
  const std::vector<Diagnostic>* diagnostics = &doc.diagnostics();

  return [=](size_t line, bool, std::string& out) -> std::optional<Style> {
    auto it = std::find_if(diagnostics->begin(), diagnostics->end(),
                           [line](const Diagnostic& d) { return d.line == line; });
    if (it == diagnostics->end()) return std::nullopt;
    out += "●";
    if (!it->severity) return warning;
    switch (*it->severity) {
      case Severity::Error: return error;
      case Severity::Warning: return warning;
      case Severity::Info: return info;
      case Severity::Hint: return hint;
    }
    return warning;
  };
}

GutterFn line_number(const Editor& editor, const Document& doc, const View& view,
                     const Theme& theme, bool is_focused, size_t width) {
  const TextBuffer& text = doc.text();
  size_t last_line = view.last_line(doc);
  // Draw a number on the last line only when it has content; an empty
  // final line (text ending in '\n') shows `~` instead.
  bool draw_last = text.line_to_byte(last_line) < text.len_bytes();

  Style linenr = theme.get("ui.linenr");
  Style linenr_select = theme.try_get("ui.linenr.selected").value_or(linenr);

  size_t current_line = text.byte_to_line(doc.selection(view.id).primary().cursor(text));
  LineNumberMode mode = editor.config.line_number;

  return [=](size_t line, bool selected, std::string& out) -> std::optional<Style> {
    if (line == last_line && !draw_last) {
      right_align(out, "~", width);
      return linenr;
    }
    size_t display = line + 1;
    if (mode == LineNumberMode::Relative && line != current_line) display = abs_diff(current_line, line);
    right_align(out, std::to_string(display), width);
    return (selected && is_focused) ? linenr_select : linenr;
  };
}

GutterFn breakpoints(const Editor& editor, const Document& doc, const View&,
                     const Theme& theme, bool, size_t) {
  Style warning = theme.get("warning");
  Style error = theme.get("error");
  Style info = theme.get("info");

  if (!doc.path()) throw MissingPathError();
  static const std::vector<Breakpoint> kNone;
  const std::vector<Breakpoint>* list = editor.breakpoints_for(*doc.path());
  if (!list) list = &kNone;

  return [=](size_t line, bool, std::string& out) -> std::optional<Style> {
    auto it = std::find_if(list->begin(), list->end(),
                           [line](const Breakpoint& b) { return b.line == line; });
    if (it == list->end()) return std::nullopt;
    const Breakpoint& bp = *it;

    Style style;
    if (bp.condition && bp.log_message) style = error.with_modifier(MOD_UNDERLINED);
    else if (bp.condition) style = error;
    else if (bp.log_message) style = info;
    else style = warning;

    if (!bp.verified) {
      if (style.fg && style.fg->kind == Color::Kind::Rgb) {
        const Color& c = *style.fg;
        style = style.with_fg(Color::rgb(fade_channel(c.r), fade_channel(c.g), fade_channel(c.b)));
      } else {
        style = style.with_fg(Color::named(Color::Kind::Gray));
      }
    }

    out += bp.verified ? "▲" : "⊚";
    return style;
  };
}

std::optional<GutterType> parse_gutter_type(std::string_view s) {
  if (s == "diagnostics") return GutterType::Diagnostics;
  if (s == "line-numbers" || s == "line_numbers") return GutterType::LineNumbers;
  if (s == "breakpoints") return GutterType::Breakpoints;
  return std::nullopt;
}

const char* gutter_type_name(GutterType t) {
  switch (t) {
    case GutterType::Diagnostics: return "diagnostics";
    case GutterType::LineNumbers: return "line-numbers";
    case GutterType::Breakpoints: return "breakpoints";
  }
  return "";
}

Gutter gutter_factory(GutterType t) {
  switch (t) {
    case GutterType::Diagnostics: return &diagnostic;
    case GutterType::LineNumbers: return &line_number;
    case GutterType::Breakpoints: return &breakpoints;
  }
  LOG(FATAL) << "unknown gutter type " << static_cast<int>(t);
  return nullptr;
}

size_t display_width(std::string_view s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

size_t BoundGutters::width() const {
  size_t w = 0;
  for (const auto& b : fns_) w += b.width;
  return w;
}

void BoundGutters::render_row(size_t line, bool selected, std::vector<GutterCell>& cells) const {
  cells.resize(fns_.size());
  for (size_t i = 0; i < fns_.size(); ++i) {
    GutterCell& cell = cells[i];
    cell.text.clear();
    cell.width = fns_[i].width;
    cell.style = fns_[i].fn(line, selected, cell.text);
  }
}

size_t GutterColumn::line_number_width(const Document& doc) {
  size_t digits = 1;
  size_t total = std::max<size_t>(1, doc.text().len_lines());
  while (total >= 10) { total /= 10; digits++; }
  return digits;
}

GutterColumn GutterColumn::from_config(const std::vector<GutterType>& kinds, const Document& doc) {
  GutterColumn col;
  for (GutterType t : kinds) {
    size_t w = (t == GutterType::LineNumbers) ? line_number_width(doc) : 1;
    col.push(t, w);
  }
  return col;
}

size_t GutterColumn::width() const {
  size_t w = 0;
  for (const auto& e : entries_) w += e.width;
  return w;
}

BoundGutters GutterColumn::bind(const Editor& editor, const Document& doc, const View& view,
                                const Theme& theme, bool is_focused) const {
  BoundGutters bound;
  bound.fns_.reserve(entries_.size());
  for (const auto& e : entries_) {
    VLOG(2) << "binding gutter " << gutter_type_name(e.type) << " width=" << e.width;
    bound.fns_.push_back({e.factory(editor, doc, view, theme, is_focused, e.width), e.width});
  }
  return bound;
}

#pragma once
/*
 * Gutter
 *
 * Purpose: per-draw-cycle renderers for the column left of the text
 *          (diagnostic markers, line numbers, breakpoint markers).
 * Protocol: a Gutter factory binds once per cycle against borrowed
 *           editor/document/view/theme state and returns a GutterFn; the
 *           compositor then calls the GutterFn once per visible line.
 * Constraint: bound state borrows the document and editor; it must not
 *             outlive the draw cycle. Factories may throw BindError;
 *             GutterFn calls never throw.
 */
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "style.hpp"

class Editor;
class Document;
class Theme;
struct View;

// Appends this line's glyphs to `out`; returns the style for them, if any.
using GutterFn = std::function<std::optional<Style>(size_t line, bool selected, std::string& out)>;
using Gutter = GutterFn (*)(const Editor& editor, const Document& doc, const View& view,
                            const Theme& theme, bool is_focused, size_t width);

GutterFn diagnostic(const Editor& editor, const Document& doc, const View& view,
                    const Theme& theme, bool is_focused, size_t width);
GutterFn line_number(const Editor& editor, const Document& doc, const View& view,
                     const Theme& theme, bool is_focused, size_t width);
// Precondition: doc.path() is set, otherwise throws MissingPathError.
GutterFn breakpoints(const Editor& editor, const Document& doc, const View& view,
                     const Theme& theme, bool is_focused, size_t width);

enum class GutterType { Diagnostics, LineNumbers, Breakpoints };

std::optional<GutterType> parse_gutter_type(std::string_view s);
const char* gutter_type_name(GutterType t);
Gutter gutter_factory(GutterType t);

// number of terminal columns, counting one per UTF-8 code point
size_t display_width(std::string_view s);

struct GutterCell {
  std::string text;
  std::optional<Style> style;
  size_t width = 0;
};

class BoundGutters {
public:
  size_t width() const;
  size_t size() const { return fns_.size(); }
  // One cell per gutter, in configured order; `cells` is reused across rows.
  void render_row(size_t line, bool selected, std::vector<GutterCell>& cells) const;

private:
  friend class GutterColumn;
  struct Bound { GutterFn fn; size_t width; };
  std::vector<Bound> fns_;
};

struct GutterEntry {
  GutterType type;
  Gutter factory;
  size_t width;
};

/* ordered gutter configuration of one view */
class GutterColumn {
public:
  static GutterColumn from_config(const std::vector<GutterType>& kinds, const Document& doc);
  static size_t line_number_width(const Document& doc);

  void push(GutterType type, size_t width) { entries_.push_back({type, gutter_factory(type), width}); }
  void push(GutterType type, Gutter factory, size_t width) { entries_.push_back({type, factory, width}); }
  const std::vector<GutterEntry>& entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }
  size_t width() const;

  // Binds every entry once; a BindError from any factory propagates.
  BoundGutters bind(const Editor& editor, const Document& doc, const View& view,
                    const Theme& theme, bool is_focused) const;

private:
  std::vector<GutterEntry> entries_;
};

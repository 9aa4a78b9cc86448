#pragma once
/*
 * Renderer
 *
 * Purpose: compositor; lays gutter cells, text and status line onto an ITerminal.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; gutters arrive already bound for this draw cycle.
 */
#include <string>
#include "types.hpp"
#include "iterminal.hpp"
#include "document.hpp"
#include "view.hpp"
#include "theme.hpp"
#include "gutter.hpp"

struct StatusInfo {
  Mode mode = Mode::Normal;
  const Document* doc = nullptr;
  const View* view = nullptr;
  std::string message;
  std::string cmdline;
};

class Renderer {
public:
  // Draws rows [view.area.row, +height): gutter cells, one blank, text.
  void render_view(ITerminal& term, const Document& doc, const View& view, const Theme& theme,
                   bool is_focused, const BoundGutters& gutters) const;
  void render_status(ITerminal& term, const Theme& theme, const StatusInfo& info) const;
};

// First `width` cells of `s`.
std::string truncate_to_width(const std::string& s, size_t width);

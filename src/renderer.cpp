#include "renderer.hpp"
#include <algorithm>
#include <set>
#include <sstream>

std::string truncate_to_width(const std::string& s, size_t width) {
  size_t cells = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
    if (cells == width) return s.substr(0, i);
    cells++;
  }
  return s;
}

void Renderer::render_view(ITerminal& term, const Document& doc, const View& view, const Theme& theme,
                           bool is_focused, const BoundGutters& gutters) const {
  const TextBuffer& text = doc.text();
  int rows = static_cast<int>(view.inner_height());
  int cols = view.area.width;
  int gutter_w = static_cast<int>(gutters.width());
  int indent = gutter_w > 0 ? gutter_w + 1 : 0; // one space after the gutter
  Style gutter_style = theme.try_get("ui.gutter").value_or(Style{});
  Style text_style = theme.try_get("ui.text").value_or(Style{});

  std::set<size_t> cursor_lines = doc.selection(view.id).cursor_lines(text);
  std::vector<GutterCell> cells;

  for (int i = 0; i < rows; ++i) {
    int row = view.area.row + i;
    size_t line = view.offset + static_cast<size_t>(i);
    term.clear_to_eol(row, view.area.col);
    if (line >= text.len_lines()) continue;

    int x = view.area.col;
    bool selected = cursor_lines.count(line) != 0;
    gutters.render_row(line, selected, cells);
    for (const auto& cell : cells) {
      std::string s = truncate_to_width(cell.text, cell.width);
      size_t w = display_width(s);
      if (w < cell.width) s.append(cell.width - w, ' ');
      Style st = cell.style ? gutter_style.patch(*cell.style) : gutter_style;
      term.draw_styled(row, x, s, st);
      x += static_cast<int>(cell.width);
    }
    if (indent > 0) term.draw_styled(row, x, " ", gutter_style);

    int text_cols = std::max(0, cols - indent);
    std::string vis = truncate_to_width(std::string(text.line(line)), static_cast<size_t>(text_cols));
    term.draw_styled(row, view.area.col + indent, vis, text_style);
  }

  if (is_focused) {
    size_t cur = doc.selection(view.id).primary().cursor(text);
    size_t cur_line = text.byte_to_line(cur);
    int screen_row = static_cast<int>(cur_line) - static_cast<int>(view.offset);
    if (screen_row >= 0 && screen_row < rows) {
      size_t line_start = text.line_to_byte(cur_line);
      std::string before(text.str().substr(line_start, cur - line_start));
      int screen_col = view.area.col + indent + static_cast<int>(display_width(before));
      screen_col = std::min(screen_col, view.area.col + std::max(0, cols - 1));
      term.move_cursor(view.area.row + screen_row, screen_col);
    }
  }
}

void Renderer::render_status(ITerminal& term, const Theme& theme, const StatusInfo& info) const {
  TermSize sz = term.getSize();
  int row = sz.rows - 1;
  Style style = theme.try_get("ui.statusline").value_or(Style{});
  std::string status;
  if (info.mode == Mode::Command) {
    status = ":" + info.cmdline;
  } else {
    std::ostringstream oss;
    oss << "NORMAL  ";
    if (info.doc) {
      oss << (info.doc->path() ? info.doc->path()->string() : "[scratch]");
      if (info.view) {
        const TextBuffer& text = info.doc->text();
        size_t cur = info.doc->selection(info.view->id).primary().cursor(text);
        size_t line = text.byte_to_line(cur);
        oss << "  " << (line + 1) << ":" << (cur - text.line_to_byte(line) + 1);
      }
      oss << "  diag:" << info.doc->diagnostics().size();
    }
    if (!info.message.empty()) oss << "  | " << info.message;
    status = oss.str();
  }
  status = truncate_to_width(status, static_cast<size_t>(std::max(0, sz.cols)));
  size_t w = display_width(status);
  if (static_cast<int>(w) < sz.cols) status.append(static_cast<size_t>(sz.cols) - w, ' ');
  term.draw_styled(row, 0, status, style);
  if (info.mode == Mode::Command) term.move_cursor(row, 1 + static_cast<int>(display_width(info.cmdline)));
}

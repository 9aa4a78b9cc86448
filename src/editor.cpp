#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <ncurses.h>
#include "bind_error.hpp"
#include "file_reader.hpp"

static constexpr int ESC = 27;

static std::string normalize_key(const std::filesystem::path& p) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(p, ec);
  if (ec) return p.lexically_normal().string();
  return abs.lexically_normal().string();
}

Editor::Editor(ITerminal& t) : term(t) {
  current_view.id = ViewId{1};
  register_commands();
  open(std::nullopt);
}

bool Editor::open(const std::optional<std::filesystem::path>& file) {
  DocumentId id{next_doc_id++};
  bool ok = true;
  if (file) {
    std::string m;
    auto d = std::make_unique<Document>(Document::from_file(id, *file, m, ok));
    message = m;
    if (!ok) {
      LOG(WARNING) << m;
      return false;
    }
    LOG(INFO) << m << " (" << d->text().len_lines() << " lines)";
    document = std::move(d);
  } else {
    document = std::make_unique<Document>(id, TextBuffer());
  }
  current_view.doc = id;
  current_view.offset = 0;
  layout_view();
  return ok;
}

void Editor::layout_view() {
  TermSize sz = term.getSize();
  current_view.area = Rect{0, 0, std::max(1, sz.rows - 1), sz.cols};
}

void Editor::run() {
  while (!should_quit) {
    render();
    int ch = term.read_key();
    if (ch < 0) break;
    handle_input(ch);
  }
}

void Editor::render() {
  layout_view();
  Document& d = doc();
  View& v = view();
  v.ensure_cursor_in_view(d);
  bool focused = is_focused(v.id);

  term.clear();
  GutterColumn column = GutterColumn::from_config(config.gutters, d);
  BoundGutters gutters;
  try {
    gutters = column.bind(*this, d, v, theme, focused);
  } catch (const BindError& e) {
    LOG(ERROR) << "gutter bind failed: " << e.what();
    message = e.what();
  }
  renderer.render_view(term, d, v, theme, focused, gutters);

  StatusInfo info;
  info.mode = mode;
  info.doc = &d;
  info.view = &v;
  info.message = message;
  info.cmdline = cmdline;
  renderer.render_status(term, theme, info);
  term.refresh();
}

void Editor::handle_input(int ch) {
  if (mode == Mode::Command) handle_command_input(ch);
  else handle_normal_input(ch);
}

void Editor::handle_normal_input(int ch) {
  switch (ch) {
    case 'q': should_quit = true; break;
    case 'j': case KEY_DOWN: move_lines(1); break;
    case 'k': case KEY_UP: move_lines(-1); break;
    case 'g': goto_line(0); break;
    case 'G': goto_line(doc().text().len_lines() - 1); break;
    case ':': mode = Mode::Command; cmdline.clear(); break;
    default: break;
  }
}

void Editor::handle_command_input(int ch) {
  if (ch == ESC) { mode = Mode::Normal; return; }
  if (ch == KEY_BACKSPACE || ch == 127) { if (!cmdline.empty()) cmdline.pop_back(); return; }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') { mode = Mode::Normal; execute_command(cmdline); return; }
  if (ch >= 32 && ch <= 126) { cmdline.push_back((char)ch); }
}

bool Editor::execute_command(const std::string& line) {
  std::string m;
  if (!registry.dispatch(line, m)) { message = m; return false; }
  return true;
}

bool Editor::load_rc(const std::filesystem::path& p) {
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(p, lines, msg)) { message = msg; LOG(WARNING) << msg; return false; }
  bool all_ok = true;
  for (std::string s : lines) {
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    if (!execute_command(s)) {
      LOG(WARNING) << p.string() << ": " << message;
      all_ok = false;
    }
  }
  LOG(INFO) << "loaded rc " << p.string();
  return all_ok;
}

void Editor::load_default_rc() {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / ".mgutterrc";
  if (!std::filesystem::exists(p, ec)) return;
  load_rc(p);
}

const std::vector<Breakpoint>* Editor::breakpoints_for(const std::filesystem::path& path) const {
  auto it = breakpoint_store.find(normalize_key(path));
  return it != breakpoint_store.end() ? &it->second : nullptr;
}

std::vector<Breakpoint>& Editor::breakpoints_mut(const std::filesystem::path& path) {
  return breakpoint_store[normalize_key(path)];
}

void Editor::clear_breakpoints(const std::filesystem::path& path) {
  breakpoint_store.erase(normalize_key(path));
}

void Editor::move_lines(long delta) {
  const TextBuffer& text = doc().text();
  size_t cur = doc().selection(view().id).primary().cursor(text);
  size_t line = text.byte_to_line(cur);
  size_t col = cur - text.line_to_byte(line);
  long target = static_cast<long>(line) + delta;
  target = std::clamp<long>(target, 0, static_cast<long>(text.len_lines()) - 1);
  size_t new_line = static_cast<size_t>(target);
  size_t pos = text.line_to_byte(new_line) + std::min(col, text.line(new_line).size());
  doc().set_selection(view().id, Selection::point(pos));
}

void Editor::goto_line(size_t line) {
  const TextBuffer& text = doc().text();
  line = std::min(line, text.len_lines() - 1);
  doc().set_selection(view().id, Selection::point(text.line_to_byte(line)));
}

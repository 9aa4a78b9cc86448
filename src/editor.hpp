#pragma once
/*
 * Editor
 *
 * Purpose: session state the gutter binds against (config, breakpoint store,
 *          theme, document, view, focus) plus the draw/input loop.
 * Note: breakpoints are indexed by normalized absolute path so the same file
 *       reached through different relative paths shares one list.
 */
#include <optional>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"
#include "breakpoint.hpp"
#include "document.hpp"
#include "view.hpp"
#include "theme.hpp"
#include "gutter.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "cmd_registry.hpp"

struct EditorConfig {
  LineNumberMode line_number = LineNumberMode::Absolute;
  std::vector<GutterType> gutters{GutterType::Diagnostics, GutterType::LineNumbers};
};

class Editor {
public:
  explicit Editor(ITerminal& term);
  Editor(const Editor&) = delete;
  Editor& operator=(const Editor&) = delete;

  // Replaces the current document with `file` (or an empty scratch buffer).
  bool open(const std::optional<std::filesystem::path>& file);
  void run();
  void render();
  void handle_input(int ch);
  bool execute_command(const std::string& cmdline);
  bool load_rc(const std::filesystem::path& path);
  void load_default_rc();

  EditorConfig config;
  Theme theme = Theme::builtin();
  bool has_focus = true;

  const std::vector<Breakpoint>* breakpoints_for(const std::filesystem::path& path) const;
  std::vector<Breakpoint>& breakpoints_mut(const std::filesystem::path& path);
  void clear_breakpoints(const std::filesystem::path& path);

  Document& doc() { return *document; }
  const Document& doc() const { return *document; }
  View& view() { return current_view; }
  const View& view() const { return current_view; }
  bool is_focused(ViewId id) const { return has_focus && current_view.id == id; }

  const std::string& status_message() const { return message; }
  Mode current_mode() const { return mode; }
  bool quit_requested() const { return should_quit; }

  void move_lines(long delta);
  void goto_line(size_t line);

private:
  void register_commands();
  void layout_view();
  void handle_normal_input(int ch);
  void handle_command_input(int ch);

  ITerminal& term;
  Renderer renderer;
  CommandRegistry registry;
  std::unique_ptr<Document> document;
  View current_view;
  std::unordered_map<std::string, std::vector<Breakpoint>> breakpoint_store;
  size_t next_doc_id = 1;
  Mode mode = Mode::Normal;
  std::string message;
  std::string cmdline;
  bool should_quit = false;
};

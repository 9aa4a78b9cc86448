#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <glog/logging.h>

static std::vector<std::string> split_on(const std::string& s, char sep) {
  std::vector<std::string> out;
  size_t st = 0;
  while (st <= s.size()) {
    size_t pos = s.find(sep, st);
    if (pos == std::string::npos) { out.push_back(s.substr(st)); break; }
    out.push_back(s.substr(st, pos - st));
    st = pos + 1;
  }
  return out;
}

static std::string join_from(const std::vector<std::string>& args, size_t from) {
  std::string out;
  for (size_t i = from; i < args.size(); ++i) {
    if (!out.empty()) out.push_back(' ');
    out += args[i];
  }
  return out;
}

// 1-based line argument → 0-based index
static bool parse_line_arg(const std::string& s, size_t& line) {
  if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  size_t v = 0;
  try { v = std::stoul(s); } catch (const std::exception&) { return false; }
  if (v < 1) return false;
  line = v - 1;
  return true;
}

static bool parse_on_off(const std::string& v, bool& out) {
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

void Editor::register_commands() {
  registry.register_command("q", [this](const std::vector<std::string>&){ should_quit = true; });
  registry.register_command("q!", [this](const std::vector<std::string>&){ should_quit = true; });

  registry.register_command("set number", [this](const std::vector<std::string>& args){
    auto& g = config.gutters;
    bool shown = std::find(g.begin(), g.end(), GutterType::LineNumbers) != g.end();
    bool want = !shown;
    if (!args.empty() && !parse_on_off(args[0], want)) { message = "set number: use :set number on|off"; return; }
    if (want && !shown) {
      // line numbers go right after the diagnostics column when there is one
      auto it = std::find(g.begin(), g.end(), GutterType::Diagnostics);
      g.insert(it == g.end() ? g.begin() : it + 1, GutterType::LineNumbers);
    } else if (!want) {
      g.erase(std::remove(g.begin(), g.end(), GutterType::LineNumbers), g.end());
    }
    message = want ? "number on" : "number off";
  });
  registry.register_command("set relativenumber", [this](const std::vector<std::string>& args){
    bool rel = config.line_number != LineNumberMode::Relative;
    if (!args.empty() && !parse_on_off(args[0], rel)) { message = "set relativenumber: use :set relativenumber on|off"; return; }
    config.line_number = rel ? LineNumberMode::Relative : LineNumberMode::Absolute;
    message = rel ? "relativenumber on" : "relativenumber off";
  });
  registry.register_command("set gutters", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "set gutters: use :set gutters diagnostics,line-numbers,breakpoints"; return; }
    std::vector<GutterType> kinds;
    for (const auto& name : split_on(args[0], ',')) {
      if (name.empty()) continue;
      auto t = parse_gutter_type(name);
      if (!t) { message = "set gutters: unknown gutter " + name; return; }
      kinds.push_back(*t);
    }
    config.gutters = std::move(kinds);
    std::string names;
    for (GutterType t : config.gutters) { if (!names.empty()) names += ","; names += gutter_type_name(t); }
    message = "gutters=" + names;
  });
  registry.register_command("set focus", [this](const std::vector<std::string>& args){
    bool f = !has_focus;
    if (!args.empty() && !parse_on_off(args[0], f)) { message = "set focus: use :set focus on|off"; return; }
    has_focus = f;
    message = f ? "focus on" : "focus off";
  });

  registry.register_command("highlight", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "highlight: use :highlight <scope> [fg=<color>] [bg=<color>] [mod=<m,...>] | clear"; return; }
    const std::string& scope = args[0];
    if (args.size() == 2 && args[1] == "clear") { theme.erase(scope); message = "cleared " + scope; return; }
    Style st;
    for (size_t i = 1; i < args.size(); ++i) {
      const std::string& a = args[i];
      size_t eq = a.find('=');
      if (eq == std::string::npos) { message = "highlight: expected key=value, got " + a; return; }
      std::string key = a.substr(0, eq);
      std::string value = a.substr(eq + 1);
      if (key == "fg" || key == "bg") {
        auto c = parse_color(value);
        if (!c) { message = "highlight: unknown color " + value; return; }
        if (key == "fg") st.fg = *c; else st.bg = *c;
      } else if (key == "mod") {
        for (const auto& m : split_on(value, ',')) {
          auto bit = parse_modifier(m);
          if (!bit) { message = "highlight: unknown modifier " + m; return; }
          st = st.with_modifier(*bit);
        }
      } else {
        message = "highlight: unknown key " + key; return;
      }
    }
    theme.set(scope, st);
    message = "highlight " + scope;
  });

  registry.register_command("diagnostic", [this](const std::vector<std::string>& args){
    size_t line = 0;
    if (args.empty() || !parse_line_arg(args[0], line)) { message = "diagnostic: use :diagnostic <line> [error|warning|info|hint|none] [message]"; return; }
    Diagnostic d;
    d.line = line;
    size_t text_from = 1;
    if (args.size() > 1) {
      if (auto sev = parse_severity(args[1])) { d.severity = sev; text_from = 2; }
      else if (args[1] == "none") { text_from = 2; }
    }
    const TextBuffer& text = doc().text();
    d.range_start = text.line_to_byte(line);
    d.range_end = d.range_start + text.line(line).size();
    d.message = join_from(args, text_from);
    d.source = "mgutter";
    doc().push_diagnostic(std::move(d));
    message = "diagnostic at " + args[0];
  });
  registry.register_command("nodiagnostics", [this](const std::vector<std::string>&){
    doc().set_diagnostics({});
    message = "diagnostics cleared";
  });

  registry.register_command("breakpoint", [this](const std::vector<std::string>& args){
    if (!doc().path()) { message = "breakpoint: buffer has no file path"; return; }
    size_t line = 0;
    if (args.empty() || !parse_line_arg(args[0], line)) { message = "breakpoint: use :breakpoint <line> [pending] [if=<cond>] [log=<msg>] [hit=<count>]"; return; }
    Breakpoint bp;
    bp.line = line;
    bp.verified = true;
    for (size_t i = 1; i < args.size(); ++i) {
      const std::string& a = args[i];
      if (a == "pending") { bp.verified = false; continue; }
      if (a == "verified") { bp.verified = true; continue; }
      size_t eq = a.find('=');
      std::string key = eq == std::string::npos ? a : a.substr(0, eq);
      std::string value = eq == std::string::npos ? std::string() : a.substr(eq + 1);
      if (key == "if") bp.condition = value;
      else if (key == "log") bp.log_message = value;
      else if (key == "hit") bp.hit_condition = value;
      else { message = "breakpoint: unknown option " + a; return; }
    }
    auto& list = breakpoints_mut(*doc().path());
    bp.id = list.size() + 1;
    list.push_back(std::move(bp));
    message = "breakpoint at " + args[0];
  });
  registry.register_command("nobreakpoints", [this](const std::vector<std::string>&){
    if (doc().path()) clear_breakpoints(*doc().path());
    message = "breakpoints cleared";
  });

  registry.register_command("goto", [this](const std::vector<std::string>& args){
    size_t line = 0;
    if (args.empty() || !parse_line_arg(args[0], line)) { message = "goto: use :goto <line>"; return; }
    goto_line(line);
  });
  registry.register_command("e", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "e: use :e <path>"; return; }
    open(std::filesystem::path(args[0]));
  });
  VLOG(1) << "registered editor commands";
}

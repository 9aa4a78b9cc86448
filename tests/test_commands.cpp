#include "editor.hpp"
#include "headless_terminal.hpp"
#include "test_util.hpp"
#include <cassert>

static void test_registry_dispatch() {
  CommandRegistry reg;
  std::vector<std::string> seen;
  reg.register_command("set tabwidth", [&](const std::vector<std::string>& args){ seen = args; });
  std::string msg;
  assert(reg.dispatch("set tabwidth=8 extra", msg));
  assert(seen.size() == 2 && seen[0] == "8" && seen[1] == "extra");
  assert(reg.dispatch("set tabwidth 4", msg));
  assert(seen.size() == 1 && seen[0] == "4");
  assert(!reg.dispatch("set nothing", msg));
  assert(msg == "unknown command: set nothing");
  assert(!reg.dispatch("bogus 1 2", msg));
  assert(msg == "unknown command: bogus");
  assert(reg.dispatch("   ", msg));
}

static void test_number_options() {
  HeadlessTerminal term(10, 40);
  Editor ed(term);
  assert(ed.config.line_number == LineNumberMode::Absolute);
  assert(ed.execute_command("set relativenumber"));
  assert(ed.config.line_number == LineNumberMode::Relative);
  assert(ed.execute_command("set relativenumber=off"));
  assert(ed.config.line_number == LineNumberMode::Absolute);
  assert(ed.execute_command("set relativenumber maybe"));
  assert(ed.status_message().find("set relativenumber: use") == 0);
  assert(ed.config.line_number == LineNumberMode::Absolute);

  assert(ed.execute_command("set number off"));
  assert(ed.config.gutters.size() == 1);
  assert(ed.config.gutters[0] == GutterType::Diagnostics);
  assert(ed.execute_command("set gutters breakpoints,diagnostics"));
  assert(ed.execute_command("set number on"));
  assert(ed.config.gutters.size() == 3);
  assert(ed.config.gutters[2] == GutterType::LineNumbers);
  assert(ed.status_message() == "number on");
}

static void test_gutters_option() {
  HeadlessTerminal term(10, 40);
  Editor ed(term);
  assert(ed.execute_command("set gutters line-numbers,diagnostics"));
  assert(ed.config.gutters.size() == 2);
  assert(ed.config.gutters[0] == GutterType::LineNumbers);
  assert(ed.status_message() == "gutters=line-numbers,diagnostics");
  assert(ed.execute_command("set gutters line-numbers,spacer"));
  assert(ed.status_message() == "set gutters: unknown gutter spacer");
  // rejected value leaves the previous configuration alone
  assert(ed.config.gutters.size() == 2);
}

static void test_highlight() {
  HeadlessTerminal term(10, 40);
  Editor ed(term);
  assert(ed.execute_command("highlight error fg=#c83232 mod=bold,underlined"));
  Style e = ed.theme.get("error");
  assert(e.fg == Color::rgb(200, 50, 50));
  assert(e.add_modifier == (MOD_BOLD | MOD_UNDERLINED));
  assert(ed.execute_command("highlight ui.gutter bg=black"));
  assert(ed.theme.get("ui.gutter").bg == Color::named(Color::Kind::Black));
  assert(ed.execute_command("highlight hint fg=nothing"));
  assert(ed.status_message() == "highlight: unknown color nothing");
  assert(ed.execute_command("highlight hint clear"));
  assert(!ed.theme.try_get("hint"));
}

static void test_marks() {
  auto p = write_temp("mgutter_test_commands.txt", "a\nb\nc\n");
  HeadlessTerminal term(10, 40);
  Editor ed(term);
  assert(ed.execute_command("breakpoint 1"));
  assert(ed.status_message() == "breakpoint: buffer has no file path");

  assert(ed.open(p));
  assert(ed.execute_command("diagnostic 3 hint unused variable x"));
  assert(ed.execute_command("diagnostic 1 none"));
  assert(ed.execute_command("diagnostic 0 error"));
  assert(ed.status_message().find("diagnostic: use") == 0);
  const auto& diags = ed.doc().diagnostics();
  assert(diags.size() == 2);
  assert(diags[0].line == 2);
  assert(diags[0].severity == Severity::Hint);
  assert(diags[0].message == "unused variable x");
  assert(diags[0].range_start == 4 && diags[0].range_end == 5);
  assert(!diags[1].severity);

  assert(ed.execute_command("breakpoint 2 pending if=i>3 log=hit hit=5"));
  const auto* bps = ed.breakpoints_for(p);
  assert(bps && bps->size() == 1);
  const Breakpoint& b = (*bps)[0];
  assert(b.line == 1 && !b.verified);
  assert(b.condition == std::string("i>3"));
  assert(b.log_message == std::string("hit"));
  assert(b.hit_condition == std::string("5"));
  assert(b.id == size_t{1});
  assert(ed.execute_command("breakpoint 3 color=red"));
  assert(ed.status_message() == "breakpoint: unknown option color=red");
  assert(ed.breakpoints_for(p)->size() == 1);

  assert(ed.execute_command("nodiagnostics"));
  assert(ed.doc().diagnostics().empty());
  assert(ed.execute_command("nobreakpoints"));
  assert(ed.breakpoints_for(p) == nullptr);
  std::filesystem::remove(p);
}

static void test_rc_file() {
  auto rc = write_temp("mgutter_test_rc",
                       "# comment\n"
                       "\" vim style comment\n"
                       "// another\n"
                       "\n"
                       "  :set relativenumber on  \n"
                       "set gutters diagnostics,line-numbers,breakpoints\n"
                       "highlight warning fg=yellow\n"
                       "frobnicate\n");
  HeadlessTerminal term(10, 40);
  Editor ed(term);
  assert(!ed.load_rc(rc));
  assert(ed.config.line_number == LineNumberMode::Relative);
  assert(ed.config.gutters.size() == 3);
  assert(ed.theme.get("warning").fg == Color::named(Color::Kind::Yellow));
  assert(ed.status_message() == "unknown command: frobnicate");
  std::filesystem::remove(rc);

  assert(!ed.load_rc(rc));
  assert(ed.status_message().find("can not open file") == 0);
}

int main() {
  test_registry_dispatch();
  test_number_options();
  test_gutters_option();
  test_highlight();
  test_marks();
  test_rc_file();
  return 0;
}

#include "editor.hpp"
#include "headless_terminal.hpp"
#include "bind_error.hpp"
#include "test_util.hpp"
#include <cassert>

static const std::filesystem::path kPath = "/tmp/mgutter_bp/main.c";

static Theme rgb_theme() {
  Theme t = Theme::builtin();
  t.set("error", Style{}.with_fg(Color::rgb(200, 50, 50)));
  t.set("warning", Style{}.with_fg(Color::rgb(250, 200, 0)));
  t.set("info", Style{}.with_fg(Color::rgb(0, 100, 255)));
  return t;
}

static Breakpoint bp(size_t line, bool verified, bool cond, bool log) {
  Breakpoint b;
  b.line = line;
  b.verified = verified;
  if (cond) b.condition = "x > 1";
  if (log) b.log_message = "x={x}";
  return b;
}

static void test_empty_store() {
  HeadlessTerminal term(24, 80);
  Editor ed(term);
  Document doc = make_doc(lines_text(10), kPath);
  View view = make_view(10);
  GutterFn fn = breakpoints(ed, doc, view, ed.theme, true, 1);
  for (size_t line = 0; line < 10; ++line) {
    Rendered r = run(fn, line);
    assert(r.text.empty());
    assert(!r.style);
  }
}

static void test_style_table() {
  HeadlessTerminal term(24, 80);
  Editor ed(term);
  Theme th = rgb_theme();
  auto& list = ed.breakpoints_mut(kPath);
  // verified: lines 0..3, unverified: lines 4..7
  for (bool verified : {true, false}) {
    size_t base = verified ? 0 : 4;
    list.push_back(bp(base + 0, verified, true, true));
    list.push_back(bp(base + 1, verified, true, false));
    list.push_back(bp(base + 2, verified, false, true));
    list.push_back(bp(base + 3, verified, false, false));
  }
  Document doc = make_doc(lines_text(10), kPath);
  View view = make_view(10);
  GutterFn fn = breakpoints(ed, doc, view, th, true, 1);

  Style error = th.get("error");
  Style info = th.get("info");
  Style warning = th.get("warning");

  Rendered both = run(fn, 0);
  assert(both.text == "▲");
  assert(both.style == error.with_modifier(MOD_UNDERLINED));
  assert(run(fn, 1).style == error);
  assert(run(fn, 2).style == info);
  assert(run(fn, 3).style == warning);
  assert(run(fn, 3).text == "▲");

  Rendered fboth = run(fn, 4);
  assert(fboth.text == "⊚");
  assert(fboth.style->fg == Color::rgb(80, 20, 20));
  assert(fboth.style->add_modifier & MOD_UNDERLINED);
  Rendered fcond = run(fn, 5);
  assert(fcond.text == "⊚");
  assert(fcond.style == error.with_fg(Color::rgb(80, 20, 20)));
  assert(run(fn, 6).style == info.with_fg(Color::rgb(0, 40, 102)));
  assert(run(fn, 7).style == warning.with_fg(Color::rgb(100, 80, 0)));
  assert(!run(fn, 8).style);
  assert(run(fn, 8).text.empty());
}

static void test_unverified_condition_example() {
  HeadlessTerminal term(24, 80);
  Editor ed(term);
  Theme th = rgb_theme();
  ed.breakpoints_mut(kPath).push_back(bp(4, false, true, false));
  Document doc = make_doc(lines_text(10), kPath);
  View view = make_view(10);
  GutterFn fn = breakpoints(ed, doc, view, th, true, 1);
  Rendered r = run(fn, 4);
  assert(r.text == "⊚");
  assert(r.style->fg == Color::rgb(80, 20, 20));
}

static void test_fade_non_rgb() {
  HeadlessTerminal term(24, 80);
  Editor ed(term);
  Theme th = rgb_theme();
  th.set("warning", Style{}.with_fg(Color::named(Color::Kind::Yellow)).with_modifier(MOD_BOLD));
  th.set("info", Style{}.with_bg(Color::named(Color::Kind::Blue)));
  ed.breakpoints_mut(kPath).push_back(bp(0, false, false, false));
  ed.breakpoints_mut(kPath).push_back(bp(1, false, false, true));
  ed.breakpoints_mut(kPath).push_back(bp(2, true, false, false));
  Document doc = make_doc(lines_text(5), kPath);
  View view = make_view(5);
  GutterFn fn = breakpoints(ed, doc, view, th, true, 1);

  Rendered named = run(fn, 0);
  assert(named.style->fg == Color::named(Color::Kind::Gray));
  assert(named.style->add_modifier & MOD_BOLD);
  // no foreground at all also fades to gray
  Rendered nofg = run(fn, 1);
  assert(nofg.style->fg == Color::named(Color::Kind::Gray));
  assert(nofg.style->bg == Color::named(Color::Kind::Blue));
  // verified keeps the theme color
  assert(run(fn, 2).style->fg == Color::named(Color::Kind::Yellow));
}

static void test_first_match_and_path_lookup() {
  HeadlessTerminal term(24, 80);
  Editor ed(term);
  Theme th = rgb_theme();
  auto rel = std::filesystem::path("mgutter_rel") / "x.c";
  ed.breakpoints_mut(rel).push_back(bp(2, true, false, true));
  ed.breakpoints_mut(rel).push_back(bp(2, false, true, false));
  Document doc = make_doc(lines_text(5), std::filesystem::current_path() / "mgutter_rel" / "." / "x.c");
  View view = make_view(5);
  GutterFn fn = breakpoints(ed, doc, view, th, true, 1);
  Rendered r = run(fn, 2);
  assert(r.text == "▲");
  assert(r.style == th.get("info"));

  Document other = make_doc(lines_text(5), "/tmp/mgutter_bp/other.c");
  GutterFn ofn = breakpoints(ed, other, view, th, true, 1);
  assert(!run(ofn, 2).style);
}

static void test_pathless_document() {
  HeadlessTerminal term(24, 80);
  Editor ed(term);
  Document doc = make_doc(lines_text(5));
  View view = make_view(5);
  bool threw = false;
  try {
    (void)breakpoints(ed, doc, view, ed.theme, true, 1);
  } catch (const MissingPathError&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_empty_store();
  test_style_table();
  test_unverified_condition_example();
  test_fade_non_rgb();
  test_first_match_and_path_lookup();
  test_pathless_document();
  return 0;
}

#include "text_buffer.hpp"
#include "selection.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void test_trailing_newline() {
  TextBuffer t("a\nbc\n");
  assert(t.len_bytes() == 5);
  assert(t.len_lines() == 3);
  assert(t.line_to_byte(0) == 0);
  assert(t.line_to_byte(1) == 2);
  assert(t.line_to_byte(2) == 5);
  // the final line is empty: its start equals the text length
  assert(t.line_to_byte(2) == t.len_bytes());
  assert(t.byte_to_line(0) == 0);
  assert(t.byte_to_line(1) == 0);
  assert(t.byte_to_line(2) == 1);
  assert(t.byte_to_line(4) == 1);
  assert(t.byte_to_line(5) == 2);
  assert(t.line(1) == "bc");
  assert(t.line(2).empty());
  assert(t.line(3).empty());
  // clamped past the end
  assert(t.line_to_byte(10) == 5);
}

static void test_no_trailing_newline() {
  TextBuffer t("x");
  assert(t.len_lines() == 1);
  assert(t.line_to_byte(0) < t.len_bytes());
  TextBuffer e;
  assert(e.len_lines() == 1);
  assert(e.line_to_byte(0) == e.len_bytes());
}

static void test_from_lines() {
  TextBuffer t = TextBuffer::from_lines({"a", "b", ""});
  assert(t.str() == "a\nb\n");
  assert(t.len_lines() == 3);
}

static void test_many_blocks() {
  std::vector<std::string> lines(3000, "line");
  TextBuffer t = TextBuffer::from_lines(lines);
  assert(t.len_lines() == 3000);
  assert(t.line_to_byte(2500) == 2500 * 5);
  assert(t.byte_to_line(2500 * 5) == 2500);
  assert(t.byte_to_line(2500 * 5 - 1) == 2499);
  for (size_t r = 1000; r < 1100; ++r) {
    assert(t.byte_to_line(t.line_to_byte(r)) == r);
    assert(t.byte_to_line(t.line_to_byte(r) + 3) == r);
  }
}

static void test_cursor() {
  // "h\xc3\xa9llo": 'é' is two bytes at [1,3)
  TextBuffer t("h\xc3\xa9llo\nx");
  assert(Range::point(3).cursor(t) == 3);
  assert((Range{5, 1}).cursor(t) == 1);
  // forward range: cursor sits on the character before head
  assert((Range{0, 3}).cursor(t) == 1);
  assert((Range{0, 7}).cursor(t) == 6);
  Selection sel({Range::point(0), Range::point(7)}, 1);
  assert(sel.primary().head == 7);
  auto lines = sel.cursor_lines(t);
  assert(lines.size() == 2);
  assert(lines.count(0) == 1 && lines.count(1) == 1);
}

static void test_from_file() {
  auto p = std::filesystem::temp_directory_path() / "mgutter_test_text_buffer.txt";
  {
    std::ofstream f(p, std::ios::binary);
    f << "one\r\ntwo\r\n";
  }
  std::string msg; bool ok = false;
  TextBuffer t = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(t.str() == "one\ntwo\n");
  assert(t.len_lines() == 3);
  std::filesystem::remove(p);

  TextBuffer missing = TextBuffer::from_file(p, msg, ok);
  assert(!ok);
  assert(msg.find("can not open file") == 0);
  assert(missing.len_lines() == 1);
}

int main() {
  test_trailing_newline();
  test_no_trailing_newline();
  test_from_lines();
  test_many_blocks();
  test_cursor();
  test_from_file();
  return 0;
}

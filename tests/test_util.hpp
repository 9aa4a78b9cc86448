#pragma once
/*
 * Test helpers shared by the gutter tests.
 */
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include "document.hpp"
#include "gutter.hpp"
#include "view.hpp"

inline Document make_doc(const std::string& text,
                         std::optional<std::filesystem::path> path = std::nullopt) {
  return Document(DocumentId{1}, TextBuffer(text), std::move(path));
}

inline View make_view(int height, size_t offset = 0) {
  View v;
  v.id = ViewId{1};
  v.doc = DocumentId{1};
  v.area = Rect{0, 0, height, 80};
  v.offset = offset;
  return v;
}

inline std::string lines_text(size_t n) {
  std::string s;
  for (size_t i = 0; i < n; ++i) {
    if (i > 0) s.push_back('\n');
    s += "line " + std::to_string(i + 1);
  }
  return s;
}

struct Rendered {
  std::string text;
  std::optional<Style> style;
};

inline Rendered run(const GutterFn& fn, size_t line, bool selected = false) {
  Rendered r;
  r.style = fn(line, selected, r.text);
  return r;
}

inline std::filesystem::path write_temp(const std::string& name, const std::string& content) {
  auto p = std::filesystem::temp_directory_path() / name;
  std::ofstream f(p, std::ios::binary);
  f << content;
  return p;
}

#pragma once
/*
 * TextBuffer
 *
 * Purpose: document text as one UTF-8 string plus a LineIndex of line starts.
 * Note: byte-oriented queries (len_bytes/line_to_byte/byte_to_line) back the
 *       gutter's last-line and cursor-line decisions.
 */
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include "line_index.hpp"

class TextBuffer {
public:
  TextBuffer() { reindex(); }
  explicit TextBuffer(std::string text) : text_(std::move(text)) { reindex(); }

  static TextBuffer from_lines(const std::vector<std::string>& lines);
  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);

  std::string_view str() const { return text_; }
  size_t len_bytes() const { return text_.size(); }
  size_t len_lines() const { return li_.line_count(); }
  // clamped to the last line
  size_t line_to_byte(size_t line) const { return li_.line_start(line); }
  size_t byte_to_line(size_t byte) const { return li_.line_of_byte(byte); }
  // without the trailing newline
  std::string_view line(size_t r) const;

  void assign(std::string text) { text_ = std::move(text); reindex(); }

private:
  void reindex() { li_.build_from_text(text_); }

  std::string text_;
  LineIndex li_;
};

#include "text_buffer.hpp"
#include "file_reader.hpp"

TextBuffer TextBuffer::from_lines(const std::vector<std::string>& lines) {
  std::string joined;
  size_t total = 0;
  for (const auto& l : lines) total += l.size() + 1;
  joined.reserve(total);
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) joined.push_back('\n');
    joined += lines[i];
  }
  return TextBuffer(std::move(joined));
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  std::vector<std::string> lines;
  ok = mmap_readlines(path, lines, msg);
  if (!ok) return TextBuffer();
  return from_lines(lines);
}

std::string_view TextBuffer::line(size_t r) const {
  if (r >= len_lines()) return {};
  size_t start = li_.line_start(r);
  size_t end = (r + 1 < len_lines()) ? li_.line_start(r + 1) - 1 : text_.size();
  return std::string_view(text_).substr(start, end - start);
}

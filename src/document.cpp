#include "document.hpp"

Document Document::from_file(DocumentId id, const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer text = TextBuffer::from_file(path, msg, ok);
  return Document(id, std::move(text), path);
}

const Selection& Document::selection(ViewId view) const {
  static const Selection kDefault;
  auto it = selections_.find(view);
  return it != selections_.end() ? it->second : kDefault;
}

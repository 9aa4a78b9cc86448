#pragma once
/*
 * Document
 *
 * Purpose: text + optional backing path + diagnostics + per-view selections.
 * Constraint: the draw cycle only reads it; edits happen between cycles.
 */
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "text_buffer.hpp"
#include "selection.hpp"
#include "diagnostic.hpp"

class Document {
public:
  Document(DocumentId id, TextBuffer text, std::optional<std::filesystem::path> path = std::nullopt)
    : id_(id), text_(std::move(text)), path_(std::move(path)) {}

  static Document from_file(DocumentId id, const std::filesystem::path& path, std::string& msg, bool& ok);

  DocumentId id() const { return id_; }
  const TextBuffer& text() const { return text_; }
  const std::optional<std::filesystem::path>& path() const { return path_; }

  const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
  void set_diagnostics(std::vector<Diagnostic> diags) { diagnostics_ = std::move(diags); }
  void push_diagnostic(Diagnostic d) { diagnostics_.push_back(std::move(d)); }

  // views that never set a selection see a cursor at offset 0
  const Selection& selection(ViewId view) const;
  void set_selection(ViewId view, Selection sel) { selections_[view] = std::move(sel); }

private:
  DocumentId id_;
  TextBuffer text_;
  std::optional<std::filesystem::path> path_;
  std::vector<Diagnostic> diagnostics_;
  std::map<ViewId, Selection> selections_;
};

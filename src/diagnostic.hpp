#pragma once
/*
 * Diagnostic
 *
 * Purpose: read-only diagnostic entries attached to a document.
 * Note: several diagnostics may share a line; consumers take the first one
 *       in the document's storage order.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

enum class Severity { Error, Warning, Info, Hint };

struct Diagnostic {
  size_t line = 0;  // 0-based
  size_t range_start = 0;  // byte offsets into the document
  size_t range_end = 0;
  std::optional<Severity> severity;
  std::string message;
  std::optional<std::string> code;
  std::optional<std::string> source;
};

inline const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error: return "error";
    case Severity::Warning: return "warning";
    case Severity::Info: return "info";
    case Severity::Hint: return "hint";
  }
  return "";
}

inline std::optional<Severity> parse_severity(std::string_view s) {
  if (s == "error") return Severity::Error;
  if (s == "warning") return Severity::Warning;
  if (s == "info") return Severity::Info;
  if (s == "hint") return Severity::Hint;
  return std::nullopt;
}

#pragma once
/*
 * Breakpoint
 *
 * Purpose: debugger breakpoint as stored per file path by the editor.
 * Note: `verified` is set once the debug adapter confirms the breakpoint.
 */
#include <cstddef>
#include <optional>
#include <string>

struct Breakpoint {
  std::optional<size_t> id;
  bool verified = false;
  std::optional<std::string> message;
  size_t line = 0;  // 0-based
  std::optional<size_t> column;
  std::optional<std::string> condition;
  std::optional<std::string> hit_condition;
  std::optional<std::string> log_message;
};

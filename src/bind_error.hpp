#pragma once
/*
 * BindError
 *
 * Purpose: precondition violations raised while binding gutter renderers.
 * Constraint: thrown at bind time only, never from a per-line render call.
 */
#include <stdexcept>
#include <string>

class BindError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Theme has no style for a name looked up with Theme::get.
class MissingStyleError : public BindError {
public:
  explicit MissingStyleError(const std::string& scope)
    : BindError("theme has no style for '" + scope + "'"), scope_(scope) {}
  const std::string& scope() const { return scope_; }
private:
  std::string scope_;
};

// Breakpoint gutter bound against a document without a backing file.
class MissingPathError : public BindError {
public:
  MissingPathError() : BindError("breakpoints gutter needs a document with a file path") {}
};

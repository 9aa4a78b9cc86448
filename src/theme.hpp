#pragma once
/*
 * Theme
 *
 * Purpose: scope name → Style table used by the gutter and the compositor.
 * Lookup: "a.b.c" falls back to "a.b" then "a" (most specific wins).
 * Errors: get() throws MissingStyleError; try_get() returns nullopt.
 */
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "style.hpp"

class Theme {
public:
  static Theme builtin();

  void set(const std::string& scope, const Style& style) { styles_[scope] = style; }
  void erase(const std::string& scope) { styles_.erase(scope); }
  bool contains_exact(const std::string& scope) const { return styles_.count(scope) != 0; }
  size_t size() const { return styles_.size(); }

  std::optional<Style> try_get(std::string_view scope) const;
  Style get(std::string_view scope) const;

private:
  std::unordered_map<std::string, Style> styles_;
};

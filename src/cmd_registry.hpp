#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands (interactive `:` line and rc file).
 * Design: map name → handler (args vector); "set <opt>[=value]" resolves to the
 *         composite name "set <opt>" with value prepended to the args.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  // Splits `cmdline` on whitespace and runs it; unknown names set msg and return false.
  bool dispatch(const std::string& cmdline, std::string& msg) const;
private:
  std::unordered_map<std::string, Handler> map_;
};

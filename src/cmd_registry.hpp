#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file `set` commands.
 * Design: map name → handler (args vector); the loader parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  /* handler returns an empty string on success, otherwise a message */
  using Handler = std::function<std::string(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  std::string execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return "unknown command: " + name;
    return it->second(args);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};

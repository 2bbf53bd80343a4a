#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc commands ("set order shuffle", "map reveal x").
 * Design: map name → handler (args vector); "set" commands are keyed by "set <option>",
 *         and "set opt=value" is accepted as "set opt value".
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<void(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    it->second(args);
    return true;
  }
  // Parses one command line; false (with message) when no handler matches.
  bool execute_line(const std::string& line, std::string& message) const;
private:
  std::unordered_map<std::string, Handler> map_;
};

#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch named commands (rc-file settings).
 * Design: map name → handler (args vector, msg); caller parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>
#include "types.hpp"

class CommandRegistry {
public:
  using Handler = std::function<Status(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  Status execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return Status::ConfigInvalid; }
    return it->second(args, msg);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};

#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands ("set center off").
 * Design: map name → handler (args vector, error message); Config parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  enum class Result { Ok, Unknown, Failed };
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  Result execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) return Result::Unknown;
    return it->second(args, msg) ? Result::Ok : Result::Failed;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};

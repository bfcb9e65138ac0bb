#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands.
 * Design: map name → (usage, handler); a handler returns false when its
 * arguments are unusable and the caller reports the usage string.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <utility>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&)>;
  enum class Result { Ok, Unknown, BadArgs };

  void register_command(const std::string& name, std::string usage, Handler h) {
    map_[name] = Entry{std::move(usage), std::move(h)};
  }

  Result execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return Result::Unknown;
    return it->second.handler(args) ? Result::Ok : Result::BadArgs;
  }

  std::string usage(const std::string& name) const {
    auto it = map_.find(name);
    return it == map_.end() ? std::string() : it->second.usage;
  }

private:
  struct Entry {
    std::string usage;
    Handler handler;
  };
  std::unordered_map<std::string, Entry> map_;
};

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

namespace trailbot::bots {

using BotFactory = std::function<std::unique_ptr<BotBrain>(const BotInitContext&)>;

struct PolicyEntry {
  std::string name;
  std::string summary;
  BotFactory factory;
};

// Decision policies by name. Lookups ignore case and whitespace.
class BotRegistry {
 public:
  void register_factory(const std::string& name, const std::string& summary, BotFactory factory);
  std::unique_ptr<BotBrain> create(const std::string& name, const BotInitContext& init_ctx) const;
  bool contains(const std::string& name) const;

  // Sorted by key.
  std::vector<std::string> names() const;
  const std::map<std::string, PolicyEntry>& entries() const {
    return policies_;
  }

 private:
  std::map<std::string, PolicyEntry> policies_;
};

}  // namespace trailbot::bots

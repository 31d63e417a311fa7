#include "registry.hpp"

#include <cctype>
#include <stdexcept>

namespace trailbot::bots {
namespace {

std::string policy_key(const std::string& name) {
  std::string key;
  for (unsigned char ch : name) {
    if (!std::isspace(ch)) {
      key.push_back(static_cast<char>(std::tolower(ch)));
    }
  }
  return key;
}

std::string joined_names(const std::map<std::string, PolicyEntry>& policies) {
  if (policies.empty()) {
    return "<none>";
  }
  std::string out;
  for (const auto& [key, entry] : policies) {
    out += out.empty() ? key : ", " + key;
  }
  return out;
}

}  // namespace

void BotRegistry::register_factory(const std::string& name, const std::string& summary, BotFactory factory) {
  std::string key = policy_key(name);
  if (key.empty()) {
    throw std::invalid_argument("Policy name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Policy '" + key + "' registered without a factory");
  }
  auto [it, inserted] = policies_.emplace(key, PolicyEntry{key, summary, std::move(factory)});
  if (!inserted) {
    throw std::invalid_argument("Policy '" + key + "' is already registered");
  }
}

std::unique_ptr<BotBrain> BotRegistry::create(const std::string& name, const BotInitContext& init_ctx) const {
  auto it = policies_.find(policy_key(name));
  if (it == policies_.end()) {
    throw std::invalid_argument("Unknown policy '" + policy_key(name) + "'. Available: " + joined_names(policies_));
  }
  return it->second.factory(init_ctx);
}

bool BotRegistry::contains(const std::string& name) const {
  return policies_.count(policy_key(name)) > 0;
}

std::vector<std::string> BotRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(policies_.size());
  for (const auto& entry : policies_) {
    out.push_back(entry.first);
  }
  return out;
}

}  // namespace trailbot::bots

#pragma once

#include <array>
#include <boost/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../config.hpp"
#include "../world.hpp"
#include "core.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace trailbot::bots {

// Player numbers outside {1, 2} fall back to 2, anything unparsable to 1.
int player_number_from(const std::optional<int>& raw);

class MatchManager {
 public:
  MatchManager(GameState initial_state, const std::string& policy_name, BrainSettings settings);

  static std::shared_ptr<MatchManager> from_config();

  void sync(const StateSync& update);

  // Snapshots state and session under the lock and decides without it.
  MoveDecision decide(int player_number);

  // Applies the final sync if any, then starts fresh sessions for both roles.
  void end_match(const std::optional<StateSync>& final_update);

  MatchSession session(int player_number) const;
  GameState snapshot() const;

  boost::json::object describe() const;

 private:
  static std::size_t role_index(int player_number);

  mutable std::mutex mutex_;
  GameState state_;
  std::array<MatchSession, 2> sessions_;
  std::uint64_t match_epoch_ = 0;
  BotRegistry registry_;
  std::string policy_name_;
  BrainSettings settings_;
  std::unique_ptr<BotBrain> brain_;
};

}  // namespace trailbot::bots

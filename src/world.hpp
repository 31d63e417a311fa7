#pragma once

#include <array>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "grid.hpp"
#include "models.hpp"

namespace trailbot {

// One state push from the game master. Every field is optional; absent
// fields leave the current value untouched when applied.
struct StateSync {
  // Row-major board[y][x], already mapped to Grid markers.
  std::optional<std::vector<std::vector<int>>> board;
  std::array<std::optional<std::vector<Cell>>, 2> trails;
  std::array<std::optional<int>, 2> lengths;
  std::array<std::optional<bool>, 2> alive;
  std::array<std::optional<int>, 2> boosts;
  std::optional<int> turn_count;
};

struct SyncParseResult {
  std::optional<StateSync> sync;
  std::string error;
};

SyncParseResult parse_state_sync(const boost::json::value& payload);
SyncParseResult parse_state_sync(const std::string& body);

class GameState {
 public:
  GameState(int width, int height, int start_boosts);

  static GameState from_config();

  void apply(const StateSync& sync);

  // Player numbers are 1 and 2.
  const Agent& agent(int player_number) const;
  const Agent& opponent_of(int player_number) const;

  OccupiedSet occupied_trails() const;

  boost::json::object describe() const;

  Grid grid;
  Agent agent1;
  Agent agent2;
  int turns = 0;

 private:
  void place_initial_layout(int start_boosts);
  void apply_trail(Agent& agent, const std::vector<Cell>& trail);
};

}  // namespace trailbot

#pragma once

#include <optional>
#include <string>

#include "../models.hpp"
#include "../world.hpp"

namespace trailbot::bots {

enum class Phase { OpenPlay, Panic, PostEscapeFill };

inline const char* to_string(Phase phase) {
  switch (phase) {
    case Phase::OpenPlay:
      return "open_play";
    case Phase::Panic:
      return "panic";
    case Phase::PostEscapeFill:
      return "post_escape_fill";
  }
  return "open_play";
}

struct CorridorAnchor {
  int safe_row = 0;
  int exit_column = 0;
};

struct MatchSession {
  Phase phase = Phase::OpenPlay;
  int escape_bias = 0;
  std::optional<CorridorAnchor> corridor;
  int decisions = 0;
};

struct Candidate {
  int space = 0;
  Direction direction = Direction::Up;
  Cell target;
};

struct MoveDecision {
  Direction direction = Direction::Up;
  bool boost = false;
  int space = -1;

  std::string wire() const {
    std::string out = to_string(direction);
    if (boost) {
      out += ":BOOST";
    }
    return out;
  }
};

struct BrainSettings {
  int panic_threshold = 1;
  int boost_space_threshold = 10;
  bool corridor_boost = false;
};

struct DecisionContext {
  const GameState* state = nullptr;
  int player_number = 1;
  const Agent* me = nullptr;
  const Agent* opponent = nullptr;
  MatchSession session;
};

struct BotInitContext {
  std::string policy_name;
  BrainSettings settings;
};

class BotBrain {
 public:
  virtual ~BotBrain() = default;
  virtual MoveDecision decide(DecisionContext& ctx) = 0;
};

}  // namespace trailbot::bots

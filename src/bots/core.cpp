#include "core.hpp"

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <vector>

#include "corridor.hpp"
#include "space.hpp"

namespace trailbot::bots {
namespace {

int space_of(const std::vector<Candidate>& candidates,
             Direction dir,
             const Grid& grid,
             const Cell& head,
             const OccupiedSet& occupied) {
  for (const auto& candidate : candidates) {
    if (candidate.direction == dir) {
      return candidate.space;
    }
  }
  return flood_fill_area(grid.step(head, dir), occupied, grid.width(), grid.height());
}

class SpaceMaxBrain : public BotBrain {
 public:
  explicit SpaceMaxBrain(const BotInitContext& init_ctx) : settings_(init_ctx.settings) {}

  MoveDecision decide(DecisionContext& ctx) override {
    const Agent& me = *ctx.me;
    const Agent& opponent = *ctx.opponent;
    const Grid& grid = ctx.state->grid;
    if (!me.has_head()) {
      return {me.heading, false, -1};
    }
    const Cell& head = me.head();
    OccupiedSet occupied = ctx.state->occupied_trails();

    OccupiedSet opponent_reach;
    if (opponent.alive && opponent.has_head()) {
      for (Direction dir : kAllDirections) {
        opponent_reach.insert(grid.step(opponent.head(), dir));
      }
    }

    std::optional<Candidate> best;
    Direction reverse = opposite(me.heading);
    for (Direction dir : kAllDirections) {
      if (dir == reverse) {
        continue;
      }
      Cell target = grid.step(head, dir);
      if (target == head || is_suicidal(grid, head, target, occupied) || opponent_reach.count(target) > 0) {
        continue;
      }
      int space = flood_fill_area(target, occupied, grid.width(), grid.height());
      if (!best || space > best->space) {
        best = Candidate{space, dir, target};
      }
    }

    if (!best) {
      auto fallback = choose_non_suicidal(grid, head, occupied, generate_candidates(grid, me, occupied));
      if (!fallback) {
        return {me.heading, false, -1};
      }
      spdlog::debug("player {}: no move clear of the opponent, taking {}", ctx.player_number,
                    to_string(fallback->direction));
      return {fallback->direction, false, fallback->space};
    }
    return {best->direction, should_boost(me, best->space, settings_.boost_space_threshold), best->space};
  }

 private:
  BrainSettings settings_;
};

class CorridorBrain : public BotBrain {
 public:
  explicit CorridorBrain(const BotInitContext& init_ctx) : settings_(init_ctx.settings) {}

  MoveDecision decide(DecisionContext& ctx) override {
    const Agent& me = *ctx.me;
    const Agent& opponent = *ctx.opponent;
    const Grid& grid = ctx.state->grid;
    MatchSession& session = ctx.session;
    if (!me.has_head()) {
      return {me.heading, false, -1};
    }
    const Cell& head = me.head();
    std::optional<Cell> opponent_head;
    if (opponent.alive && opponent.has_head()) {
      opponent_head = opponent.head();
    }

    CorridorAnchor anchor = session.corridor ? *session.corridor : corridor_for(grid, me);
    OccupiedSet occupied = ctx.state->occupied_trails();
    OccupiedSet blocked = occupied;
    OccupiedSet corridor_row = row_cells(grid, anchor.safe_row);
    blocked.insert(corridor_row.begin(), corridor_row.end());

    std::vector<Candidate> candidates = generate_candidates(grid, me, blocked);
    if (candidates.empty()) {
      return {me.heading, false, -1};
    }

    advance_phase(session, grid, me, opponent_head, settings_.panic_threshold);

    std::optional<Direction> chosen;
    if (session.phase == Phase::Panic) {
      anchor = session.corridor ? *session.corridor : anchor;
      if (auto step = plan_escape_step(session, anchor, head)) {
        if (!is_suicidal(grid, head, grid.step(head, *step), occupied)) {
          chosen = step;
        } else {
          spdlog::debug("player {}: escape step {} blocked, falling back", ctx.player_number, to_string(*step));
        }
      }
    } else if (session.phase == Phase::PostEscapeFill) {
      chosen = plan_fill_step(grid, head, occupied, session.escape_bias);
    }

    if (!chosen) {
      auto fallback = choose_non_suicidal(grid, head, occupied, candidates);
      chosen = fallback ? fallback->direction : me.heading;
    }

    MoveDecision decision;
    decision.direction = *chosen;
    decision.space = space_of(candidates, *chosen, grid, head, blocked);
    decision.boost = settings_.corridor_boost && should_boost(me, decision.space, settings_.boost_space_threshold);
    spdlog::debug("player {}: phase {} -> {} (space {})", ctx.player_number, to_string(session.phase),
                  decision.wire(), decision.space);
    return decision;
  }

 private:
  BrainSettings settings_;
};

}  // namespace

void register_core_plugins(BotRegistry& registry) {
  registry.register_factory("corridor", "flood-fill play with a corridor escape and horizontal fill",
                            [](const BotInitContext& ctx) {
                              return std::make_unique<CorridorBrain>(ctx);
                            });
  registry.register_factory("space_max", "largest reachable area outside the opponent's reach, boosting in the open",
                            [](const BotInitContext& ctx) {
                              return std::make_unique<SpaceMaxBrain>(ctx);
                            });
}

}  // namespace trailbot::bots

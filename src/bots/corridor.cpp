#include "corridor.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

#include "space.hpp"

namespace trailbot::bots {

CorridorAnchor corridor_for(const Grid& grid, const Agent& me) {
  CorridorAnchor anchor;
  if (!me.has_head()) {
    return anchor;
  }
  const Cell& origin = me.origin();
  anchor.safe_row = grid.wrap(0, origin.y + grid.height() / 2).y;
  anchor.exit_column = origin.x;
  return anchor;
}

bool corridor_infiltrated(const Cell& head, const Cell& opponent_head, const CorridorAnchor& anchor) {
  if (head.y == anchor.safe_row || opponent_head.y != anchor.safe_row) {
    return false;
  }
  int exit_x = anchor.exit_column;
  if (head.x < exit_x) {
    return head.x < opponent_head.x && opponent_head.x <= exit_x;
  }
  if (head.x > exit_x) {
    return exit_x <= opponent_head.x && opponent_head.x < head.x;
  }
  return false;
}

bool advance_phase(MatchSession& session,
                   const Grid& grid,
                   const Agent& me,
                   const std::optional<Cell>& opponent_head,
                   int panic_threshold) {
  if (!me.has_head() || !opponent_head) {
    return false;
  }
  const Cell& head = me.head();
  Phase before = session.phase;

  if (session.phase == Phase::OpenPlay && std::abs(head.x - opponent_head->x) <= panic_threshold) {
    session.phase = Phase::Panic;
    if (!session.corridor) {
      session.corridor = corridor_for(grid, me);
    }
    spdlog::debug("panic: opponent at column {} next to our column {}, corridor row {} exit column {}",
                  opponent_head->x, head.x, session.corridor->safe_row, session.corridor->exit_column);
  }

  if (session.phase == Phase::Panic && session.corridor &&
      corridor_infiltrated(head, *opponent_head, *session.corridor)) {
    session.phase = Phase::PostEscapeFill;
    spdlog::debug("corridor row {} infiltrated at column {}, switching to fill", session.corridor->safe_row,
                  opponent_head->x);
  }

  return session.phase != before;
}

std::optional<Direction> plan_escape_step(MatchSession& session, const CorridorAnchor& anchor, const Cell& head) {
  if (head.y != anchor.safe_row) {
    return head.y < anchor.safe_row ? Direction::Down : Direction::Up;
  }
  if (head.x != anchor.exit_column) {
    bool rightward = head.x < anchor.exit_column;
    session.escape_bias = rightward ? 1 : -1;
    return rightward ? Direction::Right : Direction::Left;
  }
  session.phase = Phase::PostEscapeFill;
  spdlog::debug("corridor exit reached at ({}, {})", head.x, head.y);
  return std::nullopt;
}

std::optional<Direction> plan_fill_step(const Grid& grid,
                                        const Cell& head,
                                        const OccupiedSet& occupied,
                                        int escape_bias) {
  Direction horizontal = escape_bias < 0 ? Direction::Left : Direction::Right;
  for (Direction dir : {horizontal, Direction::Up, Direction::Down}) {
    if (!is_suicidal(grid, head, grid.step(head, dir), occupied)) {
      return dir;
    }
  }
  return std::nullopt;
}

}  // namespace trailbot::bots

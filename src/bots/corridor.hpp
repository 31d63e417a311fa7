#pragma once

#include <optional>

#include "../grid.hpp"
#include "../models.hpp"
#include "types.hpp"

namespace trailbot::bots {

// Safe row half a board away from the trail origin, exit at the origin column.
CorridorAnchor corridor_for(const Grid& grid, const Agent& me);

// The opponent sits on the safe row between our column and the exit column
// while we are still off the row. The exit column itself counts.
bool corridor_infiltrated(const Cell& head, const Cell& opponent_head, const CorridorAnchor& anchor);

// OpenPlay -> Panic on close horizontal contact, Panic -> PostEscapeFill on
// infiltration. Fixes the corridor anchor on panic entry. Returns true when
// the phase changed.
bool advance_phase(MatchSession& session,
                   const Grid& grid,
                   const Agent& me,
                   const std::optional<Cell>& opponent_head,
                   int panic_threshold);

// One panic step: onto the safe row first, then along it toward the exit.
// Records the escape bias while moving horizontally. On arrival switches to
// PostEscapeFill and returns nullopt.
std::optional<Direction> plan_escape_step(MatchSession& session, const CorridorAnchor& anchor, const Cell& head);

// Fill step after the escape: keep the escape bias horizontally, otherwise
// UP, otherwise DOWN. nullopt when all three are fatal.
std::optional<Direction> plan_fill_step(const Grid& grid,
                                        const Cell& head,
                                        const OccupiedSet& occupied,
                                        int escape_bias);

}  // namespace trailbot::bots

#pragma once

#include <optional>
#include <vector>

#include "../grid.hpp"
#include "../models.hpp"
#include "types.hpp"

namespace trailbot::bots {

// Number of cells reachable from start over the wrapped 4-neighborhood
// without entering an occupied cell. An occupied start scores 0.
int flood_fill_area(const Cell& start, const OccupiedSet& occupied, int width, int height);

// A move is fatal when the grid says the target is taken, or when the
// explicit trail set contains it. Both sources have to agree a cell is free.
bool is_suicidal(const Grid& grid, const Cell& head, const Cell& target, const OccupiedSet& explicit_occupied);

// Every heading change except the reversal, scored against blocked.
std::vector<Candidate> generate_candidates(const Grid& grid, const Agent& me, const OccupiedSet& blocked);

// Highest-scoring non-fatal candidate, or the highest-scoring one when all
// of them are fatal. nullopt only for an empty list.
std::optional<Candidate> choose_non_suicidal(const Grid& grid,
                                             const Cell& head,
                                             const OccupiedSet& explicit_occupied,
                                             std::vector<Candidate> candidates);

bool should_boost(const Agent& me, int space, int threshold);

OccupiedSet row_cells(const Grid& grid, int row);

}  // namespace trailbot::bots

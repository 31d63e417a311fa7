#include <doctest/doctest.h>

#include <algorithm>
#include <vector>

#include "bots/space.hpp"
#include "test_support.hpp"

using trailbot::Agent;
using trailbot::Cell;
using trailbot::Direction;
using trailbot::Grid;
using trailbot::OccupiedSet;
using trailbot::bots::Candidate;
using trailbot::bots::choose_non_suicidal;
using trailbot::bots::flood_fill_area;
using trailbot::bots::generate_candidates;
using trailbot::bots::is_suicidal;

TEST_CASE("flood fill counts the whole open board minus the trail") {
  OccupiedSet occupied{{5, 5}};
  CHECK(flood_fill_area({5, 4}, occupied, 10, 10) == 99);
  CHECK(flood_fill_area({5, 6}, occupied, 10, 10) == 99);
  CHECK(flood_fill_area({6, 5}, occupied, 10, 10) == 99);
}

TEST_CASE("flood fill wraps around the board edges") {
  OccupiedSet wall;
  for (int y = 0; y < 4; ++y) {
    wall.insert({2, y});
  }
  // Columns 3, 0 and 1 connect through the wrap.
  CHECK(flood_fill_area({0, 0}, wall, 4, 4) == 12);

  OccupiedSet ring;
  for (int y = 0; y < 6; ++y) {
    ring.insert({1, y});
    ring.insert({4, y});
  }
  CHECK(flood_fill_area({2, 0}, ring, 6, 6) == 12);
  CHECK(flood_fill_area({0, 0}, ring, 6, 6) == 12);
}

TEST_CASE("flood fill from an occupied start is zero") {
  OccupiedSet occupied{{1, 1}};
  CHECK(flood_fill_area({1, 1}, occupied, 5, 5) == 0);
}

TEST_CASE("flood fill does not depend on the order cells were added") {
  std::vector<Cell> cells = {{0, 1}, {1, 1}, {2, 1}, {3, 1}, {4, 3}, {2, 4}, {0, 3}};
  OccupiedSet forward(cells.begin(), cells.end());
  OccupiedSet backward(cells.rbegin(), cells.rend());
  for (int x = 0; x < 5; ++x) {
    for (int y = 0; y < 5; ++y) {
      CHECK(flood_fill_area({x, y}, forward, 5, 5) == flood_fill_area({x, y}, backward, 5, 5));
    }
  }
}

TEST_CASE("flood fill never grows as the occupied set grows") {
  std::vector<Cell> additions = {{3, 0}, {3, 1}, {3, 2}, {1, 4}, {3, 4}, {3, 5}, {3, 6}, {0, 3}, {6, 3}, {5, 5}};
  OccupiedSet occupied;
  int previous = flood_fill_area({1, 1}, occupied, 7, 7);
  CHECK(previous == 49);
  for (const auto& cell : additions) {
    occupied.insert(cell);
    int area = flood_fill_area({1, 1}, occupied, 7, 7);
    CHECK(area <= previous);
    previous = area;
  }
}

TEST_CASE("every explicitly occupied cell is suicidal whatever the grid says") {
  Grid grid(6, 6);
  OccupiedSet explicit_occupied{{0, 0}, {2, 3}, {5, 5}, {4, 1}};
  grid.set({5, 5}, Grid::kUnknown);
  for (const auto& cell : explicit_occupied) {
    CHECK(is_suicidal(grid, {3, 3}, cell, explicit_occupied));
  }
}

TEST_CASE("grid occupancy alone makes a move suicidal") {
  Grid grid(6, 6);
  grid.set({1, 2}, Grid::kAgent);
  OccupiedSet none;
  CHECK(is_suicidal(grid, {1, 3}, {1, 2}, none));
  CHECK_FALSE(is_suicidal(grid, {1, 3}, {1, 4}, none));
}

TEST_CASE("unclassified grid cells fall back to the trail set") {
  Grid grid(6, 6);
  grid.set({2, 2}, Grid::kUnknown);
  OccupiedSet none;
  OccupiedSet trail{{2, 2}};
  CHECK_FALSE(is_suicidal(grid, {2, 3}, {2, 2}, none));
  CHECK(is_suicidal(grid, {2, 3}, {2, 2}, trail));
}

TEST_CASE("suicide check agrees with the grid's fail-closed classification") {
  Grid grid(4, 4);
  grid.set({0, 0}, Grid::kAgent);
  grid.set({1, 0}, Grid::kUnknown);
  grid.set({2, 0}, Grid::kUnknown);
  OccupiedSet trails{{2, 0}, {3, 3}};
  for (int x = 0; x < 4; ++x) {
    for (int y = 0; y < 4; ++y) {
      Cell cell{x, y};
      bool expected = grid.cell_state(cell, trails) == trailbot::CellState::Occupied || trails.count(cell) > 0;
      CHECK(is_suicidal(grid, {1, 1}, cell, trails) == expected);
    }
  }
  CHECK(is_suicidal(grid, {1, 1}, {4, 4}, trails));
  CHECK_FALSE(is_suicidal(grid, {1, 1}, {1, 0}, trails));
}

TEST_CASE("candidates never include the reversal or the head") {
  Grid grid(8, 8);
  OccupiedSet blocked{{4, 4}};
  for (Direction heading : trailbot::kAllDirections) {
    Agent me;
    me.trail = {{4, 4}};
    me.heading = heading;
    auto candidates = generate_candidates(grid, me, blocked);
    CHECK(candidates.size() == 3);
    for (const auto& candidate : candidates) {
      CHECK(candidate.direction != trailbot::opposite(heading));
      CHECK(candidate.target != me.head());
      CHECK(candidate.target == grid.step(me.head(), candidate.direction));
    }
  }
}

TEST_CASE("candidates that wrap onto the head are skipped") {
  Grid grid(1, 5);
  Agent me;
  me.trail = {{0, 2}};
  me.heading = Direction::Up;
  auto candidates = generate_candidates(grid, me, OccupiedSet{{0, 2}});
  REQUIRE(candidates.size() == 1);
  CHECK(candidates.front().direction == Direction::Up);
  CHECK(candidates.front().target == Cell{0, 1});

  Grid single(1, 1);
  me.trail = {{0, 0}};
  CHECK(generate_candidates(single, me, OccupiedSet{{0, 0}}).empty());
}

TEST_CASE("selection prefers the largest safe space") {
  Grid grid(6, 6);
  OccupiedSet occupied{{2, 1}};
  std::vector<Candidate> candidates = {
      {5, Direction::Up, {2, 1}},
      {9, Direction::Right, {3, 2}},
      {12, Direction::Down, {2, 3}},
  };
  auto chosen = choose_non_suicidal(grid, {2, 2}, occupied, candidates);
  REQUIRE(chosen.has_value());
  CHECK(chosen->direction == Direction::Down);

  occupied.insert({2, 3});
  chosen = choose_non_suicidal(grid, {2, 2}, occupied, candidates);
  REQUIRE(chosen.has_value());
  CHECK(chosen->direction == Direction::Right);
}

TEST_CASE("selection keeps direction order on equal space") {
  Grid grid(6, 6);
  std::vector<Candidate> candidates = {
      {7, Direction::Up, {2, 1}},
      {7, Direction::Down, {2, 3}},
      {7, Direction::Right, {3, 2}},
  };
  auto chosen = choose_non_suicidal(grid, {2, 2}, OccupiedSet{}, candidates);
  REQUIRE(chosen.has_value());
  CHECK(chosen->direction == Direction::Up);
}

TEST_CASE("selection with no safe candidate returns the largest space") {
  Grid grid(6, 6);
  OccupiedSet occupied{{2, 1}, {3, 2}, {2, 3}};
  std::vector<Candidate> candidates = {
      {1, Direction::Up, {2, 1}},
      {4, Direction::Right, {3, 2}},
      {2, Direction::Down, {2, 3}},
  };
  auto chosen = choose_non_suicidal(grid, {2, 2}, occupied, candidates);
  REQUIRE(chosen.has_value());
  CHECK(chosen->direction == Direction::Right);

  CHECK_FALSE(choose_non_suicidal(grid, {2, 2}, occupied, {}).has_value());
}

TEST_CASE("boost only with boosts left and room above the threshold") {
  Agent me;
  me.boosts_remaining = 2;
  CHECK(trailbot::bots::should_boost(me, 11, 10));
  CHECK_FALSE(trailbot::bots::should_boost(me, 10, 10));
  me.boosts_remaining = 0;
  CHECK_FALSE(trailbot::bots::should_boost(me, 80, 10));
}

#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>

#include "test_support.hpp"
#include "world.hpp"

using trailbot::Cell;
using trailbot::CellState;
using trailbot::Direction;
using trailbot::GameState;
using trailbot::Grid;
using trailbot::parse_state_sync;

TEST_CASE("fresh state uses the deterministic opening layout") {
  GameState state(20, 18, 3);
  REQUIRE(state.agent1.trail.size() == 2);
  CHECK(state.agent1.head() == Cell{2, 2});
  CHECK(state.agent1.heading == Direction::Right);
  CHECK(state.agent2.head() == Cell{16, 15});
  CHECK(state.agent2.heading == Direction::Left);
  CHECK(state.agent1.boosts_remaining == 3);
  CHECK(state.agent2.length == 2);
  CHECK(*state.grid.lookup({1, 2}) == CellState::Occupied);
  CHECK(*state.grid.lookup({10, 10}) == CellState::Empty);
  CHECK(state.turns == 0);
}

TEST_CASE("a full sync is parsed and applied") {
  auto parsed = parse_state_sync(std::string(R"({
    "board": [[0, 0, 0, 0], [0, 1, 1, 0], [0, 0, 0, 0], [0, 0, 0, 1]],
    "agent1_trail": [[1, 1], [2, 1]],
    "agent2_trail": [[3, 3]],
    "agent1_length": 2,
    "agent2_length": 1,
    "agent1_alive": true,
    "agent2_alive": false,
    "agent1_boosts": 2,
    "agent2_boosts": 0,
    "turn_count": 7
  })"));
  REQUIRE(parsed.sync.has_value());
  CHECK(parsed.error.empty());

  GameState state(4, 4, 3);
  state.apply(*parsed.sync);
  CHECK(state.agent1.head() == Cell{2, 1});
  CHECK(state.agent1.heading == Direction::Right);
  CHECK(state.agent1.boosts_remaining == 2);
  CHECK(state.agent2.head() == Cell{3, 3});
  CHECK_FALSE(state.agent2.alive);
  CHECK(state.agent2.boosts_remaining == 0);
  CHECK(state.turns == 7);
  CHECK(*state.grid.lookup({1, 1}) == CellState::Occupied);
  CHECK(*state.grid.lookup({0, 0}) == CellState::Empty);
}

TEST_CASE("a partial sync leaves absent fields untouched") {
  GameState state(20, 18, 3);
  auto parsed = parse_state_sync(std::string(R"({"agent1_boosts": 1})"));
  REQUIRE(parsed.sync.has_value());
  state.apply(*parsed.sync);

  CHECK(state.agent1.boosts_remaining == 1);
  CHECK(state.agent2.boosts_remaining == 3);
  CHECK(state.agent1.head() == Cell{2, 2});
  CHECK(state.agent1.heading == Direction::Right);
  CHECK(*state.grid.lookup({2, 2}) == CellState::Occupied);
}

TEST_CASE("heading follows the last two trail cells, across the wrap too") {
  auto state = trailbot_test::make_state(10, 10, {{9, 5}, {0, 5}}, {{4, 4}, {4, 3}});
  CHECK(state.agent1.heading == Direction::Right);
  CHECK(state.agent2.heading == Direction::Up);

  state = trailbot_test::make_state(10, 10, {{0, 0}, {0, 9}}, {{3, 3}, {2, 3}});
  CHECK(state.agent1.heading == Direction::Up);
  CHECK(state.agent2.heading == Direction::Left);
}

TEST_CASE("trail cells outside the board are wrapped") {
  auto state = trailbot_test::make_state(10, 10, {{11, -1}}, {{4, 4}});
  CHECK(state.agent1.head() == Cell{1, 9});
}

TEST_CASE("a short board leaves the missing cells unknown") {
  auto parsed = parse_state_sync(std::string(R"({"board": [[0, 1], [0]]})"));
  REQUIRE(parsed.sync.has_value());
  GameState state(3, 3, 3);
  state.apply(*parsed.sync);

  CHECK(*state.grid.lookup({0, 0}) == CellState::Empty);
  CHECK(*state.grid.lookup({1, 0}) == CellState::Occupied);
  CHECK_FALSE(state.grid.lookup({2, 0}).has_value());
  CHECK_FALSE(state.grid.lookup({1, 1}).has_value());
  CHECK_FALSE(state.grid.lookup({0, 2}).has_value());
}

TEST_CASE("unexpected board cells are treated as unknown") {
  auto parsed = parse_state_sync(std::string(R"({"board": [["x", -3, 2]]})"));
  REQUIRE(parsed.sync.has_value());
  const auto& row = parsed.sync->board->front();
  CHECK(row[0] == Grid::kUnknown);
  CHECK(row[1] == Grid::kUnknown);
  CHECK(row[2] == 2);
}

TEST_CASE("malformed payloads are rejected with a reason") {
  CHECK_FALSE(parse_state_sync(std::string()).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string("{not json")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string("[1, 2]")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string("{}")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"board": 5})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"board": [1, 2]})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"agent1_trail": []})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"agent1_trail": [[1, 2, 3]]})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"agent2_trail": [["a", 1]]})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"agent1_length": "long"})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"agent2_alive": "yes"})")).sync.has_value());
  CHECK_FALSE(parse_state_sync(std::string(R"({"turn_count": 1.5})")).sync.has_value());

  auto parsed = parse_state_sync(std::string("{}"));
  CHECK(parsed.error == "no json body");
  parsed = parse_state_sync(boost::json::value(42));
  CHECK_FALSE(parsed.error.empty());
}

TEST_CASE("integer alive flags are accepted") {
  auto parsed = parse_state_sync(std::string(R"({"agent1_alive": 0, "agent2_alive": 1})"));
  REQUIRE(parsed.sync.has_value());
  CHECK(parsed.sync->alive[0] == false);
  CHECK(parsed.sync->alive[1] == true);
}

TEST_CASE("occupied trails collect both agents") {
  auto state = trailbot_test::make_state(10, 10, {{1, 1}, {2, 1}}, {{5, 5}});
  auto occupied = state.occupied_trails();
  CHECK(occupied.size() == 3);
  CHECK(occupied.count({2, 1}) == 1);
  CHECK(occupied.count({5, 5}) == 1);
  CHECK(&state.opponent_of(1) == &state.agent2);
  CHECK(&state.agent(2) == &state.agent2);
}

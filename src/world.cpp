#include "world.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace trailbot {
namespace {

std::optional<int> as_int(const boost::json::value& value) {
  if (value.is_int64()) {
    auto raw = value.as_int64();
    if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<int>(raw);
  }
  if (value.is_uint64()) {
    auto raw = value.as_uint64();
    if (raw > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return std::nullopt;
    }
    return static_cast<int>(raw);
  }
  if (value.is_double()) {
    double raw = value.as_double();
    if (std::floor(raw) != raw || std::abs(raw) > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<int>(raw);
  }
  return std::nullopt;
}

std::optional<bool> as_bool(const boost::json::value& value) {
  if (value.is_bool()) {
    return value.as_bool();
  }
  if (auto number = as_int(value)) {
    return *number != 0;
  }
  return std::nullopt;
}

std::optional<std::vector<std::vector<int>>> parse_board(const boost::json::value& value) {
  if (!value.is_array()) {
    return std::nullopt;
  }
  std::vector<std::vector<int>> rows;
  rows.reserve(value.as_array().size());
  for (const auto& row_value : value.as_array()) {
    if (!row_value.is_array()) {
      return std::nullopt;
    }
    std::vector<int> row;
    row.reserve(row_value.as_array().size());
    for (const auto& cell_value : row_value.as_array()) {
      auto marker = as_int(cell_value);
      if (!marker || *marker < 0) {
        row.push_back(Grid::kUnknown);
      } else {
        row.push_back(*marker == Grid::kEmpty ? Grid::kEmpty : *marker);
      }
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

std::optional<std::vector<Cell>> parse_trail(const boost::json::value& value) {
  if (!value.is_array() || value.as_array().empty()) {
    return std::nullopt;
  }
  std::vector<Cell> trail;
  trail.reserve(value.as_array().size());
  for (const auto& point : value.as_array()) {
    if (!point.is_array() || point.as_array().size() != 2) {
      return std::nullopt;
    }
    auto x = as_int(point.as_array()[0]);
    auto y = as_int(point.as_array()[1]);
    if (!x || !y) {
      return std::nullopt;
    }
    trail.push_back({*x, *y});
  }
  return trail;
}

SyncParseResult reject(std::string reason) {
  SyncParseResult result;
  result.error = std::move(reason);
  return result;
}

}  // namespace

SyncParseResult parse_state_sync(const boost::json::value& payload) {
  if (!payload.is_object()) {
    return reject("state payload must be a JSON object");
  }
  const auto& object = payload.as_object();
  if (object.empty()) {
    return reject("no json body");
  }

  StateSync sync;
  if (auto it = object.find("board"); it != object.end()) {
    sync.board = parse_board(it->value());
    if (!sync.board) {
      return reject("board must be an array of rows");
    }
  }

  for (int i = 0; i < 2; ++i) {
    const std::string prefix = "agent" + std::to_string(i + 1) + "_";
    if (auto it = object.find(prefix + "trail"); it != object.end()) {
      sync.trails[i] = parse_trail(it->value());
      if (!sync.trails[i]) {
        return reject(prefix + "trail must be a non-empty list of [x, y] pairs");
      }
    }
    if (auto it = object.find(prefix + "length"); it != object.end()) {
      sync.lengths[i] = as_int(it->value());
      if (!sync.lengths[i]) {
        return reject(prefix + "length must be an integer");
      }
    }
    if (auto it = object.find(prefix + "alive"); it != object.end()) {
      sync.alive[i] = as_bool(it->value());
      if (!sync.alive[i]) {
        return reject(prefix + "alive must be a boolean");
      }
    }
    if (auto it = object.find(prefix + "boosts"); it != object.end()) {
      sync.boosts[i] = as_int(it->value());
      if (!sync.boosts[i]) {
        return reject(prefix + "boosts must be an integer");
      }
    }
  }

  if (auto it = object.find("turn_count"); it != object.end()) {
    sync.turn_count = as_int(it->value());
    if (!sync.turn_count) {
      return reject("turn_count must be an integer");
    }
  }

  SyncParseResult result;
  result.sync = std::move(sync);
  return result;
}

SyncParseResult parse_state_sync(const std::string& body) {
  if (body.empty()) {
    return reject("no json body");
  }
  boost::system::error_code ec;
  boost::json::value value = boost::json::parse(body, ec);
  if (ec) {
    return reject("invalid json: " + ec.message());
  }
  return parse_state_sync(value);
}

GameState::GameState(int width, int height, int start_boosts) : grid(width, height) {
  place_initial_layout(start_boosts);
}

GameState GameState::from_config() {
  const auto& cfg = config::get();
  return GameState(cfg.board_width, cfg.board_height, cfg.start_boosts);
}

void GameState::place_initial_layout(int start_boosts) {
  agent1 = Agent{};
  agent1.trail = {grid.wrap(1, 2), grid.wrap(2, 2)};
  agent1.heading = Direction::Right;
  agent1.length = 2;
  agent1.boosts_remaining = start_boosts;

  agent2 = Agent{};
  agent2.trail = {grid.wrap(17, 15), grid.wrap(16, 15)};
  agent2.heading = Direction::Left;
  agent2.length = 2;
  agent2.boosts_remaining = start_boosts;

  grid.fill(Grid::kEmpty);
  for (const auto& cell : agent1.trail) {
    grid.set(cell, Grid::kAgent);
  }
  for (const auto& cell : agent2.trail) {
    grid.set(cell, Grid::kAgent);
  }
  turns = 0;
}

void GameState::apply(const StateSync& sync) {
  if (sync.board) {
    const auto& rows = *sync.board;
    for (int y = 0; y < grid.height(); ++y) {
      for (int x = 0; x < grid.width(); ++x) {
        int marker = Grid::kUnknown;
        if (y < static_cast<int>(rows.size()) && x < static_cast<int>(rows[y].size())) {
          marker = rows[y][x];
        }
        grid.set({x, y}, marker);
      }
    }
  }

  Agent* agents[2] = {&agent1, &agent2};
  for (int i = 0; i < 2; ++i) {
    Agent& agent = *agents[i];
    if (sync.trails[i]) {
      apply_trail(agent, *sync.trails[i]);
    }
    if (sync.lengths[i]) {
      agent.length = *sync.lengths[i];
    }
    if (sync.alive[i]) {
      agent.alive = *sync.alive[i];
    }
    if (sync.boosts[i]) {
      agent.boosts_remaining = *sync.boosts[i];
    }
  }

  if (sync.turn_count) {
    turns = *sync.turn_count;
  }
}

void GameState::apply_trail(Agent& agent, const std::vector<Cell>& trail) {
  agent.trail.clear();
  agent.trail.reserve(trail.size());
  for (const auto& cell : trail) {
    agent.trail.push_back(grid.wrap(cell.x, cell.y));
  }
  if (agent.trail.size() < 2) {
    return;
  }
  const Cell& prev = agent.trail[agent.trail.size() - 2];
  const Cell& head = agent.trail.back();
  for (Direction dir : kAllDirections) {
    if (grid.step(prev, dir) == head) {
      agent.heading = dir;
      break;
    }
  }
}

const Agent& GameState::agent(int player_number) const {
  return player_number == 1 ? agent1 : agent2;
}

const Agent& GameState::opponent_of(int player_number) const {
  return player_number == 1 ? agent2 : agent1;
}

OccupiedSet GameState::occupied_trails() const {
  OccupiedSet occupied;
  occupied.reserve(agent1.trail.size() + agent2.trail.size());
  occupied.insert(agent1.trail.begin(), agent1.trail.end());
  occupied.insert(agent2.trail.begin(), agent2.trail.end());
  return occupied;
}

boost::json::object GameState::describe() const {
  boost::json::object payload;
  boost::json::object board;
  board["w"] = grid.width();
  board["h"] = grid.height();
  payload["board"] = std::move(board);
  payload["turn"] = turns;

  boost::json::array agents;
  for (const Agent* agent : {&agent1, &agent2}) {
    boost::json::object row;
    if (agent->has_head()) {
      row["head"] = boost::json::array{agent->head().x, agent->head().y};
    } else {
      row["head"] = nullptr;
    }
    row["heading"] = to_string(agent->heading);
    row["alive"] = agent->alive;
    row["length"] = agent->length;
    row["boosts"] = agent->boosts_remaining;
    row["trailCells"] = static_cast<int>(agent->trail.size());
    agents.push_back(std::move(row));
  }
  payload["agents"] = std::move(agents);
  return payload;
}

}  // namespace trailbot

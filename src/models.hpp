#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace trailbot {

struct Cell {
  int x = 0;
  int y = 0;

  bool operator==(const Cell& other) const {
    return x == other.x && y == other.y;
  }

  bool operator!=(const Cell& other) const {
    return !(*this == other);
  }
};

struct CellHash {
  std::size_t operator()(const Cell& cell) const noexcept {
    return static_cast<std::size_t>(cell.x) * 1315423911u + static_cast<std::size_t>(cell.y);
  }
};

using OccupiedSet = std::unordered_set<Cell, CellHash>;

enum class Direction { Up, Down, Right, Left };

inline constexpr std::array<Direction, 4> kAllDirections = {
    Direction::Up,
    Direction::Down,
    Direction::Right,
    Direction::Left,
};

inline std::pair<int, int> delta(Direction dir) {
  switch (dir) {
    case Direction::Up:
      return {0, -1};
    case Direction::Down:
      return {0, 1};
    case Direction::Right:
      return {1, 0};
    case Direction::Left:
      return {-1, 0};
  }
  return {0, 0};
}

inline Direction opposite(Direction dir) {
  switch (dir) {
    case Direction::Up:
      return Direction::Down;
    case Direction::Down:
      return Direction::Up;
    case Direction::Right:
      return Direction::Left;
    case Direction::Left:
      return Direction::Right;
  }
  return dir;
}

inline const char* to_string(Direction dir) {
  switch (dir) {
    case Direction::Up:
      return "UP";
    case Direction::Down:
      return "DOWN";
    case Direction::Right:
      return "RIGHT";
    case Direction::Left:
      return "LEFT";
  }
  return "UP";
}

struct Agent {
  std::vector<Cell> trail;
  Direction heading = Direction::Right;
  bool alive = true;
  int length = 0;
  int boosts_remaining = 0;

  bool has_head() const {
    return !trail.empty();
  }

  const Cell& head() const {
    return trail.back();
  }

  const Cell& origin() const {
    return trail.front();
  }
};

}  // namespace trailbot

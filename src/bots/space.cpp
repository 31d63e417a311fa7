#include "space.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>

namespace trailbot::bots {
namespace {

int wrap(int value, int size) {
  return ((value % size) + size) % size;
}

}  // namespace

int flood_fill_area(const Cell& start, const OccupiedSet& occupied, int width, int height) {
  if (width <= 0 || height <= 0) {
    return 0;
  }
  Cell origin{wrap(start.x, width), wrap(start.y, height)};
  if (occupied.count(origin) > 0) {
    return 0;
  }

  std::vector<char> visited(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), 0);
  auto index = [width](const Cell& cell) {
    return static_cast<std::size_t>(cell.y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(cell.x);
  };

  std::deque<Cell> queue;
  queue.push_back(origin);
  visited[index(origin)] = 1;
  int area = 0;
  while (!queue.empty()) {
    Cell current = queue.front();
    queue.pop_front();
    ++area;
    for (Direction dir : kAllDirections) {
      auto [dx, dy] = delta(dir);
      Cell next{wrap(current.x + dx, width), wrap(current.y + dy, height)};
      if (visited[index(next)] || occupied.count(next) > 0) {
        continue;
      }
      visited[index(next)] = 1;
      queue.push_back(next);
    }
  }
  return area;
}

bool is_suicidal(const Grid& grid, const Cell&, const Cell& target, const OccupiedSet& explicit_occupied) {
  Cell wrapped = grid.wrap(target.x, target.y);
  return grid.cell_state(wrapped, explicit_occupied) != CellState::Empty || explicit_occupied.count(wrapped) > 0;
}

std::vector<Candidate> generate_candidates(const Grid& grid, const Agent& me, const OccupiedSet& blocked) {
  std::vector<Candidate> candidates;
  if (!me.has_head()) {
    return candidates;
  }
  const Cell& head = me.head();
  Direction reverse = opposite(me.heading);
  for (Direction dir : kAllDirections) {
    if (dir == reverse) {
      continue;
    }
    Cell target = grid.step(head, dir);
    if (target == head) {
      continue;
    }
    int space = flood_fill_area(target, blocked, grid.width(), grid.height());
    candidates.push_back({space, dir, target});
  }
  return candidates;
}

std::optional<Candidate> choose_non_suicidal(const Grid& grid,
                                             const Cell& head,
                                             const OccupiedSet& explicit_occupied,
                                             std::vector<Candidate> candidates) {
  if (candidates.empty()) {
    return std::nullopt;
  }
  std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    return a.space > b.space;
  });
  for (const auto& candidate : candidates) {
    if (!is_suicidal(grid, head, candidate.target, explicit_occupied)) {
      return candidate;
    }
  }
  return candidates.front();
}

bool should_boost(const Agent& me, int space, int threshold) {
  return me.boosts_remaining > 0 && space > threshold;
}

OccupiedSet row_cells(const Grid& grid, int row) {
  OccupiedSet cells;
  cells.reserve(static_cast<std::size_t>(grid.width()));
  for (int x = 0; x < grid.width(); ++x) {
    cells.insert(grid.wrap(x, row));
  }
  return cells;
}

}  // namespace trailbot::bots

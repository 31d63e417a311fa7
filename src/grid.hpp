#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

#include "models.hpp"

namespace trailbot {

enum class CellState { Empty, Occupied };

// Toroidal board. Every coordinate is wrapped, the board has no edges.
class Grid {
 public:
  static constexpr int kEmpty = 0;
  static constexpr int kAgent = 1;
  // Marker for cells a snapshot could not classify.
  static constexpr int kUnknown = -1;

  Grid(int width, int height)
      : width_(std::max(1, width)),
        height_(std::max(1, height)),
        cells_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_), kEmpty) {}

  int width() const {
    return width_;
  }

  int height() const {
    return height_;
  }

  Cell wrap(int x, int y) const {
    return {((x % width_) + width_) % width_, ((y % height_) + height_) % height_};
  }

  Cell step(const Cell& from, Direction dir) const {
    auto [dx, dy] = delta(dir);
    return wrap(from.x + dx, from.y + dy);
  }

  // Raw classification, or nullopt when the snapshot left the cell unclassified.
  std::optional<CellState> lookup(const Cell& cell) const {
    int marker = cells_[index(cell)];
    if (marker == kUnknown) {
      return std::nullopt;
    }
    return marker == kEmpty ? CellState::Empty : CellState::Occupied;
  }

  // Unclassified cells count as occupied only when the trail set confirms it.
  CellState cell_state(const Cell& cell, const OccupiedSet& trails) const {
    if (auto state = lookup(cell)) {
      return *state;
    }
    Cell wrapped = wrap(cell.x, cell.y);
    return trails.count(wrapped) > 0 ? CellState::Occupied : CellState::Empty;
  }

  void set(const Cell& cell, int marker) {
    cells_[index(cell)] = marker;
  }

  void fill(int marker) {
    std::fill(cells_.begin(), cells_.end(), marker);
  }

 private:
  std::size_t index(const Cell& cell) const {
    Cell wrapped = wrap(cell.x, cell.y);
    return static_cast<std::size_t>(wrapped.y) * static_cast<std::size_t>(width_) +
           static_cast<std::size_t>(wrapped.x);
  }

  int width_;
  int height_;
  std::vector<int> cells_;
};

}  // namespace trailbot

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <protovalue/data/structure.hpp>

namespace protovalue::data {

/**
 * \brief Fixed-size 2D grid of cells with toggleable activation.
 *
 * Cells are addressed by `(x, y)` or by row-major linear index
 * `y * width + x`. Orthogonally adjacent cells are joined by edges of weight
 * `kEdgeWeight`; the neighbor table is built once at construction and stored
 * as CSR (`neighbor_offsets`, `neighbor_indices`, `neighbor_weights`).
 * Only the activation mask is mutable.
 */
class GridGraph {
public:
  /// \brief Weight of every edge between 4-adjacent cells.
  static constexpr double kEdgeWeight = 0.25;
  /// \brief Largest supported cell count; keeps CSR neighbor offsets within `int`.
  static constexpr int64_t kMaxCells = std::numeric_limits<int>::max() / 4;

  /**
   * \brief Construct a fully active `width x height` grid.
   * \throws std::invalid_argument when either dimension is not positive or the
   * cell count exceeds `kMaxCells`.
   */
  GridGraph(int width, int height) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
      throw std::invalid_argument("GridGraph dimensions must be positive, got " +
                                  std::to_string(width) + "x" +
                                  std::to_string(height));
    }
    if (static_cast<int64_t>(width) * height > kMaxCells) {
      throw std::invalid_argument("GridGraph of " + std::to_string(width) + "x" +
                                  std::to_string(height) + " exceeds " +
                                  std::to_string(kMaxCells) + " cells");
    }
    active_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), 1u);
    build_neighbors();
  }

  [[nodiscard]] int width() const { return width_; }
  [[nodiscard]] int height() const { return height_; }
  [[nodiscard]] int num_cells() const { return width_ * height_; }

  /// \return Number of currently active cells.
  [[nodiscard]] int num_active() const {
    return static_cast<int>(std::count(active_.begin(), active_.end(), 1u));
  }

  /// \return `true` when `(x, y)` lies inside the grid.
  [[nodiscard]] bool contains(int x, int y) const {
    return x >= 0 && x < width_ && y >= 0 && y < height_;
  }

  /**
   * \brief Row-major linear index of `(x, y)`.
   * \throws std::out_of_range when `(x, y)` lies outside the grid.
   */
  [[nodiscard]] int cell_index(int x, int y) const {
    check_bounds(x, y);
    return y * width_ + x;
  }

  /// \throws std::out_of_range when `(x, y)` lies outside the grid.
  [[nodiscard]] bool is_active(int x, int y) const {
    return active_[static_cast<size_t>(cell_index(x, y))] != 0;
  }

  /// \throws std::out_of_range when `(x, y)` lies outside the grid.
  void set_active(int x, int y, bool active) {
    active_[static_cast<size_t>(cell_index(x, y))] = active ? 1u : 0u;
  }

  void set_all(bool active) { std::fill(active_.begin(), active_.end(), active ? 1u : 0u); }

  /// \brief Activation lookup by linear index. Unchecked.
  [[nodiscard]] bool is_active_cell(int cell) const {
    return active_[static_cast<size_t>(cell)] != 0;
  }

  /// \brief Neighbor cells of `cell` in ascending linear order. Unchecked.
  [[nodiscard]] std::span<const int> get_neighborhood(int cell) const {
    const int begin = neighbor_offsets_[static_cast<size_t>(cell)];
    const int end = neighbor_offsets_[static_cast<size_t>(cell) + 1];
    return {neighbor_indices_.data() + begin, static_cast<size_t>(end - begin)};
  }

  /// \brief Edge weights parallel to `get_neighborhood(cell)`. Unchecked.
  [[nodiscard]] std::span<const double> get_neighbor_weights(int cell) const {
    const int begin = neighbor_offsets_[static_cast<size_t>(cell)];
    const int end = neighbor_offsets_[static_cast<size_t>(cell) + 1];
    return {neighbor_weights_.data() + begin, static_cast<size_t>(end - begin)};
  }

  /**
   * \brief Weight of the edge between two cells.
   * \return `kEdgeWeight` for 4-adjacent cells, `0` otherwise (including `a == b`).
   * \throws std::out_of_range when either index is not a cell of this grid.
   */
  [[nodiscard]] double edge_weight(int a, int b) const {
    if (a < 0 || a >= num_cells() || b < 0 || b >= num_cells()) {
      throw std::out_of_range("GridGraph cell index out of range");
    }
    const auto nbrs = get_neighborhood(a);
    const auto weights = get_neighbor_weights(a);
    for (size_t k = 0; k < nbrs.size(); ++k) {
      if (nbrs[k] == b) {
        return weights[k];
      }
    }
    return 0.0;
  }

private:
  /// \brief Throw `std::out_of_range` unless `(x, y)` lies inside the grid.
  void check_bounds(int x, int y) const {
    if (!contains(x, y)) {
      throw std::out_of_range("Cell (" + std::to_string(x) + ", " + std::to_string(y) +
                              ") outside " + std::to_string(width_) + "x" +
                              std::to_string(height_) + " grid");
    }
  }

  /// \brief Fill the CSR neighbor table from the grid dimensions.
  void build_neighbors() {
    const int n = num_cells();
    neighbor_offsets_.assign(static_cast<size_t>(n) + 1, 0);
    neighbor_indices_.clear();
    neighbor_weights_.clear();
    neighbor_indices_.reserve(static_cast<size_t>(n) * 4);
    neighbor_weights_.reserve(static_cast<size_t>(n) * 4);

    // Offsets ordered up, left, right, down keep each row sorted.
    constexpr int kDx[4] = {0, -1, 1, 0};
    constexpr int kDy[4] = {-1, 0, 0, 1};
    for (int y = 0; y < height_; ++y) {
      for (int x = 0; x < width_; ++x) {
        const int cell = y * width_ + x;
        for (int k = 0; k < 4; ++k) {
          const int nx = x + kDx[k];
          const int ny = y + kDy[k];
          if (contains(nx, ny)) {
            neighbor_indices_.push_back(ny * width_ + nx);
            neighbor_weights_.push_back(kEdgeWeight);
          }
        }
        neighbor_offsets_[static_cast<size_t>(cell) + 1] =
            static_cast<int>(neighbor_indices_.size());
      }
    }
  }

  /// \brief Number of columns.
  int width_ = 0;
  /// \brief Number of rows.
  int height_ = 0;
  /// \brief Row-major activation mask (`0` or `1`).
  std::vector<uint8_t> active_;
  /// \brief CSR row offsets into the neighbor arrays (`num_cells() + 1`).
  std::vector<int> neighbor_offsets_;
  /// \brief CSR neighbor cell indices.
  std::vector<int> neighbor_indices_;
  /// \brief CSR edge weights parallel to `neighbor_indices_`.
  std::vector<double> neighbor_weights_;
};

static_assert(CellGraph<GridGraph>);

} // namespace protovalue::data

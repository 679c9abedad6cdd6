#pragma once

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <protovalue/core/config.hpp>
#include <protovalue/data/grid_graph.hpp>
#include <protovalue/data/spectral_basis.hpp>
#include <protovalue/ops/spectral.hpp>

namespace protovalue {

/**
 * \brief Grid plus its current basis and the selected basis function.
 *
 * This is the state a painting front end drives: cell writes and resets
 * rebuild the basis, and two selectors (basis index and eigenvalue) pick the
 * function to display. Every rebuild is a full recomputation.
 */
class Session {
public:
  Session(int width, int height)
      : grid_(width, height), basis_(width, height) {
    rebuild();
  }

  /// \brief Adopt an existing grid, e.g. one loaded from a mask file.
  explicit Session(data::GridGraph grid)
      : grid_(std::move(grid)), basis_(grid_.width(), grid_.height()) {
    rebuild();
  }

  [[nodiscard]] const data::GridGraph &grid() const { return grid_; }
  [[nodiscard]] const data::SpectralBasis &basis() const { return basis_; }
  /// \return Selected basis index (meaningless while the basis is empty).
  [[nodiscard]] int selected() const { return selected_; }
  [[nodiscard]] int rebuild_count() const { return rebuild_count_; }

  /**
   * \brief Paint one cell.
   *
   * Coordinates outside the grid are ignored, and the basis is only rebuilt
   * when the cell actually changes state.
   * \return `true` when a rebuild happened.
   */
  bool set_cell(int x, int y, bool active) {
    if (!grid_.contains(x, y) || grid_.is_active(x, y) == active) {
      return false;
    }
    grid_.set_active(x, y, active);
    rebuild();
    return true;
  }

  /// \brief Activate every cell and rebuild.
  void reset() {
    grid_.set_all(true);
    rebuild();
  }

  /// \throws std::out_of_range when `index` is not a valid basis index.
  void select(int index) {
    if (index < 0 || index >= basis_.size()) {
      throw std::out_of_range("Cannot select basis function " + std::to_string(index) +
                              " of " + std::to_string(basis_.size()));
    }
    selected_ = index;
  }

  /**
   * \brief Select the first basis function whose eigenvalue reaches `value`.
   * \return The selected index, clamped to the last basis function.
   * \throws std::out_of_range when the basis is empty.
   * \throws std::invalid_argument when `value` is not finite.
   */
  int select_eigenvalue(double value) {
    if (basis_.empty()) {
      throw std::out_of_range("Cannot select an eigenvalue on an empty basis");
    }
    selected_ = std::min(basis_.eigenvalue_index(value), basis_.size() - 1);
    return selected_;
  }

  /// \throws std::out_of_range when the basis is empty.
  [[nodiscard]] data::BasisFunction current() const { return basis_.at(selected_); }

private:
  void rebuild() {
    basis_ = ops::compute_pvf_basis(grid_);
    ++rebuild_count_;
    if (!basis_.empty()) {
      selected_ = std::min(selected_, basis_.size() - 1);
    }
    if (core::verbose_from_env()) {
      std::cout << "[Session] Rebuild " << rebuild_count_ << ": " << basis_.size()
                << " basis functions.\n";
    }
  }

  data::GridGraph grid_;
  data::SpectralBasis basis_;
  int selected_ = 0;
  int rebuild_count_ = 0;
};

} // namespace protovalue

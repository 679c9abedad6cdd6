#pragma once

#include <Eigen/Dense>

#include <protovalue/data/grid_graph.hpp>
#include <protovalue/data/spectral_basis.hpp>

namespace protovalue::test_support {

/// Two rooms joined by a single doorway in a vertical wall at `x = width / 2`.
inline data::GridGraph make_two_rooms(int width, int height) {
  data::GridGraph grid(width, height);
  const int wall = width / 2;
  for (int y = 0; y < height; ++y) {
    if (y != height / 2) {
      grid.set_active(wall, y, false);
    }
  }
  return grid;
}

/// Two rooms separated by a full wall: two connected components.
inline data::GridGraph make_split_rooms(int width, int height) {
  data::GridGraph grid(width, height);
  const int wall = width / 2;
  for (int y = 0; y < height; ++y) {
    grid.set_active(wall, y, false);
  }
  return grid;
}

/// Rectangle with an off-centre L-shaped obstacle; no reflection symmetry.
inline data::GridGraph make_irregular_room(int width, int height) {
  data::GridGraph grid(width, height);
  for (int x = 2; x < width / 2; ++x) {
    grid.set_active(x, 2, false);
  }
  for (int y = 2; y < height - 2; ++y) {
    grid.set_active(2, y, false);
  }
  grid.set_active(width - 1, height - 1, false);
  return grid;
}

/// Active-slot restriction of embedded eigenvector `k` of `basis`.
inline Eigen::VectorXd restrict_to_active(const data::SpectralBasis &basis, int k) {
  const auto &active = basis.active_indices();
  Eigen::VectorXd v(static_cast<Eigen::Index>(active.size()));
  for (size_t i = 0; i < active.size(); ++i) {
    v[static_cast<Eigen::Index>(i)] = basis.eigenvectors()(active[i], k);
  }
  return v;
}

} // namespace protovalue::test_support

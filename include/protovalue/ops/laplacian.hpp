#pragma once

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <cmath>
#include <iostream>
#include <vector>

#include <protovalue/core/config.hpp>
#include <protovalue/data/structure.hpp>

namespace protovalue::ops {

/**
 * \brief Weighted adjacency of the subgraph induced by the active cells.
 *
 * Slots are assigned to active cells in ascending cell order. `cell_to_slot`
 * maps every grid cell to its slot (`-1` when inactive) and is reused for
 * re-embedding solved eigenvectors. The adjacency is stored as CSR with sorted
 * columns and an explicit diagonal entry per row holding the degree
 * correction `1 - (sum of surviving neighbor weights)`.
 */
struct ActiveSubgraph {
  /// \brief Linear cell index of each slot.
  std::vector<int> active_indices;
  /// \brief Slot of each grid cell, `-1` for inactive cells.
  std::vector<int> cell_to_slot;

  /// \brief CSR row offsets (`size() + 1`).
  std::vector<int> row_offsets;
  /// \brief CSR column slots.
  std::vector<int> col_indices;
  /// \brief CSR adjacency weights, diagonal included.
  std::vector<double> values;

  /// \brief Row sums of the corrected adjacency.
  Eigen::VectorXd row_sums;
  /// \brief `1 / sqrt(row_sums[i])`, or `1` where the row sum is not positive.
  Eigen::VectorXd inv_sqrt_degree;

  /// \return Number of active cells in the subgraph.
  [[nodiscard]] int size() const { return static_cast<int>(active_indices.size()); }
};

/**
 * \brief Extract the degree-corrected adjacency of the active cells of `graph`.
 * \param graph Source graph snapshot.
 * \return CSR subgraph with normalization factors filled in.
 */
template <data::CellGraph GraphT>
ActiveSubgraph extract_active_subgraph(const GraphT &graph) {
  ActiveSubgraph sub;
  const int n_cells = graph.num_cells();

  sub.cell_to_slot.assign(static_cast<size_t>(n_cells), -1);
  for (int cell = 0; cell < n_cells; ++cell) {
    if (graph.is_active_cell(cell)) {
      sub.cell_to_slot[static_cast<size_t>(cell)] = static_cast<int>(sub.active_indices.size());
      sub.active_indices.push_back(cell);
    }
  }

  const int n = sub.size();
  sub.row_offsets.assign(static_cast<size_t>(n) + 1, 0);
  sub.row_sums.setZero(n);
  sub.inv_sqrt_degree.setOnes(n);

  for (int i = 0; i < n; ++i) {
    const int cell = sub.active_indices[static_cast<size_t>(i)];
    const auto nbrs = graph.get_neighborhood(cell);
    const auto weights = graph.get_neighbor_weights(cell);

    double neighbor_sum = 0.0;
    for (size_t k = 0; k < nbrs.size(); ++k) {
      if (sub.cell_to_slot[static_cast<size_t>(nbrs[k])] >= 0 && nbrs[k] != cell) {
        neighbor_sum += weights[k];
      }
    }

    bool diagonal_written = false;
    const auto write_diagonal = [&]() {
      sub.col_indices.push_back(i);
      sub.values.push_back(1.0 - neighbor_sum);
      diagonal_written = true;
    };

    for (size_t k = 0; k < nbrs.size(); ++k) {
      const int j = sub.cell_to_slot[static_cast<size_t>(nbrs[k])];
      if (j < 0 || j == i) {
        continue;
      }
      if (!diagonal_written && j > i) {
        write_diagonal();
      }
      sub.col_indices.push_back(j);
      sub.values.push_back(weights[k]);
    }
    if (!diagonal_written) {
      write_diagonal();
    }
    sub.row_offsets[static_cast<size_t>(i) + 1] = static_cast<int>(sub.col_indices.size());

    double row_sum = 0.0;
    for (int idx = sub.row_offsets[static_cast<size_t>(i)];
         idx < sub.row_offsets[static_cast<size_t>(i) + 1]; ++idx) {
      row_sum += sub.values[static_cast<size_t>(idx)];
    }
    sub.row_sums[i] = row_sum;
    if (row_sum > 0.0) {
      sub.inv_sqrt_degree[i] = 1.0 / std::sqrt(row_sum);
    }
  }

  if (core::verbose_from_env()) {
    std::cout << "[Grid] Extracted subgraph: " << n << " of " << n_cells
              << " cells active, " << sub.col_indices.size() << " stored entries.\n";
  }
  return sub;
}

/**
 * \brief Sparse shifted symmetric-normalized Laplacian `(1 - shift) I - D^-1/2 A D^-1/2`.
 * \param sub Degree-corrected subgraph.
 * \param shift Value subtracted from the diagonal; `0` gives the Laplacian itself.
 * \return `size() x size()` sparse matrix.
 */
inline Eigen::SparseMatrix<double> normalized_laplacian(const ActiveSubgraph &sub,
                                                        double shift = 0.0) {
  const int n = sub.size();
  std::vector<Eigen::Triplet<double>> triplets;
  triplets.reserve(sub.values.size() + static_cast<size_t>(n));

  for (int i = 0; i < n; ++i) {
    triplets.emplace_back(i, i, 1.0 - shift);
    const int begin = sub.row_offsets[static_cast<size_t>(i)];
    const int end = sub.row_offsets[static_cast<size_t>(i) + 1];
    for (int idx = begin; idx < end; ++idx) {
      const int j = sub.col_indices[static_cast<size_t>(idx)];
      const double w = sub.values[static_cast<size_t>(idx)];
      triplets.emplace_back(i, j, -w * sub.inv_sqrt_degree[i] * sub.inv_sqrt_degree[j]);
    }
  }

  Eigen::SparseMatrix<double> L(n, n);
  L.setFromTriplets(triplets.begin(), triplets.end());
  L.makeCompressed();
  return L;
}

/// \brief Dense form of `normalized_laplacian(sub)` for the full eigensolve.
inline Eigen::MatrixXd dense_normalized_laplacian(const ActiveSubgraph &sub) {
  const int n = sub.size();
  Eigen::MatrixXd L = Eigen::MatrixXd::Identity(n, n);
  for (int i = 0; i < n; ++i) {
    const int begin = sub.row_offsets[static_cast<size_t>(i)];
    const int end = sub.row_offsets[static_cast<size_t>(i) + 1];
    for (int idx = begin; idx < end; ++idx) {
      const int j = sub.col_indices[static_cast<size_t>(idx)];
      L(i, j) -= sub.values[static_cast<size_t>(idx)] * sub.inv_sqrt_degree[i] *
                 sub.inv_sqrt_degree[j];
    }
  }
  return L;
}

/**
 * \brief Spectra-compatible product with the normalized adjacency
 * `D^-1/2 A D^-1/2` of an `ActiveSubgraph`.
 *
 * The largest algebraic eigenvalues `mu` of this operator correspond to the
 * smallest Laplacian eigenvalues `1 - mu` with identical eigenvectors.
 */
class NormalizedAdjacencyCsrMatProd {
public:
  using Scalar = double;

  explicit NormalizedAdjacencyCsrMatProd(const ActiveSubgraph &sub) : sub_(sub) {}

  [[nodiscard]] int rows() const { return sub_.size(); }
  [[nodiscard]] int cols() const { return sub_.size(); }

  /**
   * \brief Apply matrix-vector product.
   * \param x_in Input vector.
   * \param y_out Output vector.
   */
  void perform_op(const Scalar *x_in, Scalar *y_out) const {
    const double *inv_sqrt_data = sub_.inv_sqrt_degree.data();
    const int n = sub_.size();
    for (int i = 0; i < n; ++i) {
      const int begin = sub_.row_offsets[static_cast<size_t>(i)];
      const int end = sub_.row_offsets[static_cast<size_t>(i) + 1];
      double acc = 0.0;
      for (int idx = begin; idx < end; ++idx) {
        const int j = sub_.col_indices[static_cast<size_t>(idx)];
        acc += sub_.values[static_cast<size_t>(idx)] * (x_in[j] * inv_sqrt_data[j]);
      }
      y_out[i] = inv_sqrt_data[i] * acc;
    }
  }

private:
  /// \brief Subgraph providing the CSR adjacency and `D^-1/2` scaling.
  const ActiveSubgraph &sub_;
};

} // namespace protovalue::ops

#pragma once
#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <Spectra/SymEigsSolver.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <protovalue/core/config.hpp>
#include <protovalue/data/spectral_basis.hpp>
#include <protovalue/data/structure.hpp>
#include <protovalue/ops/laplacian.hpp>

namespace protovalue::ops {

/// \brief Relative tolerance for picking the scaling component of an eigenvector.
constexpr double kPivotRelativeTolerance = 1e-9;

/**
 * \brief Sort eigenpairs by ascending eigenvalue and floor negatives to zero.
 *
 * The sort is stable, so eigenvectors sharing an eigenvalue keep the order the
 * solver produced them in.
 * \param eigenvalues Eigenvalues, reordered in place.
 * \param eigenvectors Matching eigenvectors as columns, reordered in place.
 */
inline void sort_eigenpairs(Eigen::VectorXd &eigenvalues, Eigen::MatrixXd &eigenvectors) {
  const int n = static_cast<int>(eigenvalues.size());
  std::vector<int> order(static_cast<size_t>(n));
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](int a, int b) { return eigenvalues[a] < eigenvalues[b]; });

  Eigen::VectorXd sorted_values(n);
  Eigen::MatrixXd sorted_vectors(eigenvectors.rows(), n);
  for (int k = 0; k < n; ++k) {
    const int src = order[static_cast<size_t>(k)];
    sorted_values[k] = std::max(eigenvalues[src], 0.0);
    sorted_vectors.col(k) = eigenvectors.col(src);
  }
  eigenvalues.swap(sorted_values);
  eigenvectors.swap(sorted_vectors);
}

/**
 * \brief Divide each eigenvector by its signed component of largest magnitude.
 *
 * The pivot is the first component (in slot order) whose magnitude is within
 * `kPivotRelativeTolerance` of the maximum, so the pivot becomes exactly `+1`
 * and every other component lies in `[-1, 1]`. All-zero columns are left as is.
 * \param eigenvectors Eigenvectors as columns, normalized in place.
 */
inline void normalize_eigenvectors(Eigen::MatrixXd &eigenvectors) {
  for (Eigen::Index k = 0; k < eigenvectors.cols(); ++k) {
    auto v = eigenvectors.col(k);
    const double max_abs = v.size() == 0 ? 0.0 : v.cwiseAbs().maxCoeff();
    if (!(max_abs > 0.0)) {
      continue;
    }

    const double threshold = max_abs * (1.0 - kPivotRelativeTolerance);
    Eigen::Index pivot = 0;
    while (std::abs(v[pivot]) < threshold) {
      ++pivot;
    }

    const double pivot_value = v[pivot];
    v /= pivot_value;
    v = v.cwiseMax(-1.0).cwiseMin(1.0);
    v[pivot] = 1.0;
  }
}

/**
 * \brief Scatter subgraph eigenvectors back onto the full grid.
 * \param sub Subgraph the eigenvectors were solved on.
 * \param n_cells Number of grid cells.
 * \param eigenvectors `sub.size() x k` eigenvectors.
 * \return `n_cells x k` matrix, zero on rows of inactive cells.
 */
inline Eigen::MatrixXd embed_eigenvectors(const ActiveSubgraph &sub, int n_cells,
                                          const Eigen::MatrixXd &eigenvectors) {
  Eigen::MatrixXd embedded = Eigen::MatrixXd::Zero(n_cells, eigenvectors.cols());
  for (int i = 0; i < sub.size(); ++i) {
    embedded.row(sub.active_indices[static_cast<size_t>(i)]) = eigenvectors.row(i);
  }
  return embedded;
}

/**
 * \brief Full eigendecomposition of the normalized Laplacian of `sub`.
 * \param sub Degree-corrected subgraph with at least one node.
 * \param eigenvalues Output eigenvalues, ascending.
 * \param eigenvectors Output unit eigenvectors as columns.
 * \throws std::runtime_error when the solver does not converge.
 */
inline void solve_dense_spectrum(const ActiveSubgraph &sub, Eigen::VectorXd &eigenvalues,
                                 Eigen::MatrixXd &eigenvectors) {
  const Eigen::MatrixXd L = dense_normalized_laplacian(sub);
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(L);
  if (solver.info() != Eigen::Success) {
    std::cerr << "[Spectral] Dense solve failed. Info: " << (int)solver.info() << "\n";
    throw std::runtime_error("Normalized Laplacian eigendecomposition did not converge");
  }
  eigenvalues = solver.eigenvalues();
  eigenvectors = solver.eigenvectors();
}

/**
 * \brief Lanczos solve for the `n_basis` smallest Laplacian eigenpairs of `sub`.
 *
 * Requires `1 <= n_basis < sub.size() - 1`.
 * \param sub Degree-corrected subgraph.
 * \param n_basis Number of eigenpairs requested.
 * \param eigenvalues Output Laplacian eigenvalues.
 * \param eigenvectors Output eigenvectors as columns.
 * \return Converged eigenpair count, `0` when Lanczos failed.
 */
inline int solve_lanczos_spectrum(const ActiveSubgraph &sub, int n_basis,
                                  Eigen::VectorXd &eigenvalues,
                                  Eigen::MatrixXd &eigenvectors) {
  const int n = sub.size();
  NormalizedAdjacencyCsrMatProd op(sub);

  const int full_ncv = std::min(n, std::max(2 * n_basis + 1, 20));
  const bool try_compact = n_basis >= 32;
  const int compact_ncv =
      try_compact ? std::min(n, std::max(n_basis + 16, 20)) : full_ncv;

  const auto solve = [&](int ncv) -> int {
    Spectra::SymEigsSolver<NormalizedAdjacencyCsrMatProd> eigs(op, n_basis, ncv);
    eigs.init();
    const int nconv = eigs.compute(Spectra::SortRule::LargestAlge);
    if (eigs.info() != Spectra::CompInfo::Successful || nconv < n_basis) {
      return 0;
    }
    eigenvalues = Eigen::VectorXd::Ones(nconv) - eigs.eigenvalues();
    eigenvectors = eigs.eigenvectors(nconv);
    return nconv;
  };

  if (try_compact && compact_ncv < full_ncv) {
    const int nconv = solve(compact_ncv);
    if (nconv > 0) {
      return nconv;
    }
  }
  return solve(full_ncv);
}

/// \brief Eigenvalues closer than this to the largest requested one count as ties.
constexpr double kSpectrumGapTolerance = 1e-7;

/**
 * \brief Check that `eigenvalues` holds every Laplacian eigenvalue of `sub`
 * below its largest entry.
 *
 * A single-start Krylov solve can return too few copies of a repeated
 * eigenvalue, such as one zero per disconnected region. The number of
 * Laplacian eigenvalues below `max(eigenvalues) - kSpectrumGapTolerance` is
 * read off the inertia of a sparse LDLT factorization of the shifted
 * Laplacian and compared with the same count over `eigenvalues`.
 * \param sub Degree-corrected subgraph the eigenvalues were solved on.
 * \param eigenvalues Laplacian eigenvalues returned by the solver, any order.
 * \return `false` on a count mismatch or when the factorization fails.
 */
inline bool lanczos_spectrum_is_complete(const ActiveSubgraph &sub,
                                         const Eigen::VectorXd &eigenvalues) {
  if (eigenvalues.size() == 0) {
    return true;
  }
  const double shift = eigenvalues.maxCoeff() - kSpectrumGapTolerance;
  const Eigen::Index expected = (eigenvalues.array() < shift).count();

  const Eigen::SparseMatrix<double> shifted = normalized_laplacian(sub, shift);
  Eigen::SimplicialLDLT<Eigen::SparseMatrix<double>> ldlt(shifted);
  if (ldlt.info() != Eigen::Success) {
    return false;
  }
  // Sylvester's law of inertia: negative pivots count eigenvalues below the shift.
  const Eigen::Index below = (ldlt.vectorD().array() < 0.0).count();
  return below == expected;
}

/**
 * \brief Compute the full proto-value function basis of `graph`.
 *
 * Extracts the active subgraph, applies the degree correction, solves the
 * symmetric-normalized Laplacian densely and re-embeds the normalized
 * eigenvectors into the grid. A graph with no active cell yields an empty
 * basis.
 * \param graph Grid snapshot.
 * \return One basis function per active cell, ascending eigenvalue.
 */
template <data::CellGraph GraphT>
data::SpectralBasis compute_pvf_basis(const GraphT &graph) {
  const bool verbose = core::verbose_from_env();
  const ActiveSubgraph sub = extract_active_subgraph(graph);
  const int n = sub.size();
  if (n == 0) {
    if (verbose) {
      std::cout << "[Spectral] No active cells, basis is empty.\n";
    }
    return data::SpectralBasis(graph.width(), graph.height());
  }

  if (verbose) {
    std::cout << "[Spectral] Computing all " << n << " eigenfunctions...\n";
  }

  Eigen::VectorXd eigenvalues;
  Eigen::MatrixXd eigenvectors;
  solve_dense_spectrum(sub, eigenvalues, eigenvectors);
  sort_eigenpairs(eigenvalues, eigenvectors);
  normalize_eigenvectors(eigenvectors);

  data::SpectralDiagnostics diag;
  diag.used_mode = data::SpectralSolveMode::DenseSelfAdjoint;
  diag.nconv = static_cast<int>(eigenvalues.size());

  if (verbose) {
    std::cout << "[Spectral] Eigenvalues span [" << eigenvalues[0] << ", "
              << eigenvalues[n - 1] << "].\n";
  }

  return data::SpectralBasis(graph.width(), graph.height(), sub.active_indices,
                             std::move(eigenvalues),
                             embed_eigenvectors(sub, graph.num_cells(), eigenvectors),
                             diag);
}

/**
 * \brief Compute the `n_basis` smoothest proto-value functions of `graph`.
 *
 * Uses a Lanczos solve on the normalized adjacency when the subgraph is large
 * enough (see `core::solver_mode_from_env`), otherwise the dense solve followed
 * by truncation. A Lanczos result that fails `lanczos_spectrum_is_complete`
 * is discarded in favour of the dense solve. `n_basis` larger than the active
 * cell count is clamped.
 * \param graph Grid snapshot.
 * \param n_basis Number of basis functions requested.
 * \return Up to `n_basis` basis functions, ascending eigenvalue.
 * \throws std::invalid_argument when `n_basis < 0`.
 */
template <data::CellGraph GraphT>
data::SpectralBasis compute_pvf_basis(const GraphT &graph, int n_basis) {
  if (n_basis < 0) {
    throw std::invalid_argument("n_basis must be non-negative, got " +
                                std::to_string(n_basis));
  }

  const bool verbose = core::verbose_from_env();
  const ActiveSubgraph sub = extract_active_subgraph(graph);
  const int n = sub.size();
  const int k = std::min(n_basis, n);
  if (k == 0) {
    return data::SpectralBasis(graph.width(), graph.height(), sub.active_indices,
                               Eigen::VectorXd(),
                               Eigen::MatrixXd::Zero(graph.num_cells(), 0));
  }

  if (verbose) {
    std::cout << "[Spectral] Computing smoothest " << k << " of " << n
              << " eigenfunctions...\n";
  }

  const core::SolverMode mode = core::solver_mode_from_env();
  const bool lanczos_possible = k + 1 < n;
  const bool use_lanczos =
      lanczos_possible &&
      (mode == core::SolverMode::Lanczos ||
       (mode == core::SolverMode::Auto && n >= core::lanczos_min_cells_from_env() &&
        2 * k < n));

  data::SpectralDiagnostics diag;
  Eigen::VectorXd eigenvalues;
  Eigen::MatrixXd eigenvectors;

  if (use_lanczos) {
    const int nconv = solve_lanczos_spectrum(sub, k, eigenvalues, eigenvectors);
    if (nconv == 0) {
      std::cerr << "[Spectral] Lanczos solve failed, falling back to dense solver.\n";
      diag.fell_back = true;
    } else if (!lanczos_spectrum_is_complete(sub, eigenvalues)) {
      std::cerr << "[Spectral] Lanczos missed part of the low spectrum, falling back to "
                   "dense solver.\n";
      diag.fell_back = true;
    } else {
      diag.used_mode = data::SpectralSolveMode::Lanczos;
      diag.nconv = nconv;
      if (verbose) {
        std::cout << "[Spectral] Converged! Found " << nconv << " eigenvectors.\n";
      }
    }
  }

  if (diag.used_mode != data::SpectralSolveMode::Lanczos) {
    solve_dense_spectrum(sub, eigenvalues, eigenvectors);
    diag.used_mode = data::SpectralSolveMode::DenseSelfAdjoint;
    diag.nconv = static_cast<int>(eigenvalues.size());
  }

  sort_eigenpairs(eigenvalues, eigenvectors);
  Eigen::VectorXd head_values = eigenvalues.head(k);
  Eigen::MatrixXd head_vectors = eigenvectors.leftCols(k);
  normalize_eigenvectors(head_vectors);

  return data::SpectralBasis(graph.width(), graph.height(), sub.active_indices,
                             std::move(head_values),
                             embed_eigenvectors(sub, graph.num_cells(), head_vectors),
                             diag);
}

} // namespace protovalue::ops

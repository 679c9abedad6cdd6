#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <protovalue/data/slice.hpp>

namespace protovalue::data {

/// \brief Basis function sampled on the full grid; row `y`, column `x`.
using GridField = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// \brief Eigensolver path that produced a basis.
enum class SpectralSolveMode {
  None,
  DenseSelfAdjoint,
  Lanczos
};

/// \brief Record of how a basis was solved.
struct SpectralDiagnostics {
  /// \brief Solver that produced the returned eigenpairs.
  SpectralSolveMode used_mode = SpectralSolveMode::None;
  /// \brief Converged eigenpairs reported by the solver.
  int nconv = 0;
  /// \brief Lanczos was attempted and the dense path took over.
  bool fell_back = false;
};

/// \brief One proto-value function and its Laplacian eigenvalue.
struct BasisFunction {
  /// \brief Laplacian eigenvalue.
  double eigenvalue = 0.0;
  /// \brief `height x width` samples, zero at inactive cells.
  GridField values;
};

/**
 * \brief Immutable proto-value function basis over a grid snapshot.
 *
 * `SpectralBasis` owns:
 * - ascending, non-negative eigenvalues (`eigenvalues()`)
 * - eigenvectors embedded into the full grid as the columns of a
 *   `(width * height) x size()` matrix, zero at inactive cells
 * - the active cell indices the basis was built from
 *
 * Instances are produced by `ops::compute_pvf_basis` and rebuilt rather than
 * updated when the grid changes.
 */
class SpectralBasis {
public:
  /// \brief Empty basis over a `width x height` grid.
  SpectralBasis(int width, int height) : width_(width), height_(height) {
    eigenvectors_.setZero(static_cast<Eigen::Index>(width) * height, 0);
  }

  /**
   * \brief Assemble a basis from solved and embedded eigenpairs.
   * \param active_indices Ascending linear indices of the decomposed cells.
   * \param eigenvalues Ascending eigenvalues, one per column of `eigenvectors`.
   * \param eigenvectors Embedded basis with `width * height` rows.
   * \param diagnostics Solver record.
   * \throws std::invalid_argument on inconsistent shapes.
   */
  SpectralBasis(int width, int height, std::vector<int> active_indices,
                Eigen::VectorXd eigenvalues, Eigen::MatrixXd eigenvectors,
                SpectralDiagnostics diagnostics = {})
      : width_(width), height_(height), active_indices_(std::move(active_indices)),
        eigenvalues_(std::move(eigenvalues)), eigenvectors_(std::move(eigenvectors)),
        diagnostics_(diagnostics) {
    if (eigenvectors_.rows() != static_cast<Eigen::Index>(width) * height ||
        eigenvectors_.cols() != eigenvalues_.size() ||
        eigenvalues_.size() > static_cast<Eigen::Index>(active_indices_.size())) {
      throw std::invalid_argument("SpectralBasis shape mismatch");
    }
  }

  [[nodiscard]] int width() const { return width_; }
  [[nodiscard]] int height() const { return height_; }

  /// \return Number of basis functions.
  [[nodiscard]] int size() const { return static_cast<int>(eigenvalues_.size()); }
  [[nodiscard]] bool empty() const { return size() == 0; }

  /// \return Ascending eigenvalues.
  [[nodiscard]] const Eigen::VectorXd &eigenvalues() const { return eigenvalues_; }
  /// \return Active cell indices of the source snapshot, ascending.
  [[nodiscard]] const std::vector<int> &active_indices() const { return active_indices_; }
  [[nodiscard]] const SpectralDiagnostics &diagnostics() const { return diagnostics_; }
  /// \return All embedded eigenvectors, one per column.
  [[nodiscard]] const Eigen::MatrixXd &eigenvectors() const { return eigenvectors_; }

  /**
   * \brief Embedded eigenvector `i` in row-major cell order.
   * \throws std::out_of_range when `i` is not in `[0, size())`.
   */
  [[nodiscard]] Eigen::VectorXd eigenvector(int i) const {
    check_index(i);
    return eigenvectors_.col(i);
  }

  /**
   * \brief Basis function `i` as an `(eigenvalue, height x width field)` pair.
   * \throws std::out_of_range when `i` is not in `[0, size())`.
   */
  [[nodiscard]] BasisFunction at(int i) const {
    check_index(i);
    BasisFunction out;
    out.eigenvalue = eigenvalues_[i];
    out.values = Eigen::Map<const GridField>(eigenvectors_.col(i).data(), height_, width_);
    return out;
  }

  [[nodiscard]] BasisFunction operator[](int i) const { return at(i); }

  /**
   * \brief Basis functions selected by `s`, in slice order.
   * \throws std::invalid_argument when the slice step is zero.
   */
  [[nodiscard]] std::vector<BasisFunction> slice(const Slice &s) const {
    std::vector<BasisFunction> out;
    for (int i : s.indices(size())) {
      out.push_back(at(i));
    }
    return out;
  }

  /// \throws std::out_of_range when the basis is empty.
  [[nodiscard]] double min_eigenvalue() const {
    check_not_empty("min_eigenvalue");
    return eigenvalues_[0];
  }

  /// \throws std::out_of_range when the basis is empty.
  [[nodiscard]] double max_eigenvalue() const {
    check_not_empty("max_eigenvalue");
    return eigenvalues_[eigenvalues_.size() - 1];
  }

  /**
   * \brief Lower-bound search over the ascending eigenvalues.
   * \return Smallest `i` with `eigenvalues()[i] >= target`, or `size()` when
   * `target` exceeds every eigenvalue.
   * \throws std::invalid_argument when `target` is NaN or infinite.
   */
  [[nodiscard]] int eigenvalue_index(double target) const {
    if (!std::isfinite(target)) {
      throw std::invalid_argument("eigenvalue_index target must be finite");
    }
    const double *begin = eigenvalues_.data();
    const double *end = begin + eigenvalues_.size();
    return static_cast<int>(std::lower_bound(begin, end, target) - begin);
  }

private:
  /// \brief Throw `std::out_of_range` unless `i` indexes a basis function.
  void check_index(int i) const {
    if (i < 0 || i >= size()) {
      throw std::out_of_range("Invalid basis index: " + std::to_string(i) + " (size " +
                              std::to_string(size()) + ")");
    }
  }

  /// \brief Throw `std::out_of_range` naming `what` when the basis is empty.
  void check_not_empty(const char *what) const {
    if (empty()) {
      throw std::out_of_range(std::string(what) + " on an empty basis");
    }
  }

  /// \brief Grid columns.
  int width_ = 0;
  /// \brief Grid rows.
  int height_ = 0;
  /// \brief Active cells of the source snapshot, ascending.
  std::vector<int> active_indices_;
  /// \brief Ascending eigenvalues.
  Eigen::VectorXd eigenvalues_;
  /// \brief Embedded eigenvectors, `(width * height) x size()`.
  Eigen::MatrixXd eigenvectors_;
  /// \brief Solver record.
  SpectralDiagnostics diagnostics_;
};

} // namespace protovalue::data

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <protovalue/data/grid_graph.hpp>
#include <protovalue/ops/laplacian.hpp>
#include <protovalue/ops/spectral.hpp>

#include "support/grids.hpp"
#include "support/test_env.hpp"
#include "support/tolerances.hpp"

using protovalue::data::GridGraph;
using protovalue::data::SpectralBasis;
using protovalue::test_support::kTolLoose;
using protovalue::test_support::kTolMedium;

static void check_basis_invariants(const GridGraph &grid, const SpectralBasis &basis) {
  REQUIRE(basis.size() == grid.num_active());
  const auto &evals = basis.eigenvalues();

  for (int i = 0; i < basis.size(); ++i) {
    CHECK(evals[i] >= 0.0);
    CHECK(evals[i] <= 2.0 + kTolMedium);
    if (i + 1 < basis.size()) {
      CHECK(evals[i] <= evals[i + 1]);
    }

    const Eigen::VectorXd v = basis.eigenvector(i);
    CHECK(v.cwiseAbs().maxCoeff() == doctest::Approx(1.0).epsilon(kTolMedium));
    for (int cell = 0; cell < grid.num_cells(); ++cell) {
      if (!grid.is_active_cell(cell)) {
        CHECK(v[cell] == 0.0);
      }
    }

    const int idx = basis.eigenvalue_index(evals[i]);
    CHECK(idx <= i);
    CHECK(evals[idx] == evals[i]);
  }

  if (!basis.empty()) {
    CHECK(basis.eigenvalue_index(basis.max_eigenvalue() + 1.0) == basis.size());
  }
}

TEST_CASE("Three-cell path has the scaled path-Laplacian spectrum") {
  protovalue::test_support::configure_deterministic_test_env();
  const GridGraph grid(3, 1);
  const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);

  REQUIRE(basis.size() == 3);
  CHECK(std::abs(basis.min_eigenvalue()) <= kTolMedium);
  CHECK(basis.max_eigenvalue() > 0.0);
  CHECK(basis.eigenvalues()[1] == doctest::Approx(0.25));
  CHECK(basis.eigenvalues()[2] == doctest::Approx(0.75));

  const auto constant = basis.at(0).values;
  const auto linear = basis.at(1).values;
  const auto bump = basis.at(2).values;
  for (int x = 0; x < 3; ++x) {
    CHECK(constant(0, x) == doctest::Approx(1.0));
  }
  CHECK(linear(0, 0) == doctest::Approx(1.0));
  CHECK(std::abs(linear(0, 1)) <= kTolMedium);
  CHECK(linear(0, 2) == doctest::Approx(-1.0));
  CHECK(bump(0, 0) == doctest::Approx(-0.5));
  CHECK(bump(0, 1) == doctest::Approx(1.0));
  CHECK(bump(0, 2) == doctest::Approx(-0.5));

  for (int i = 0; i < basis.size(); ++i) {
    CHECK(basis.eigenvalue_index(basis.eigenvalues()[i]) == i);
  }
  check_basis_invariants(grid, basis);
}

TEST_CASE("Two-by-two grid has a doubly degenerate middle eigenvalue") {
  protovalue::test_support::configure_deterministic_test_env();
  const GridGraph grid(2, 2);
  const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);

  REQUIRE(basis.size() == 4);
  CHECK(std::abs(basis.eigenvalues()[0]) <= kTolMedium);
  CHECK(basis.eigenvalues()[1] == doctest::Approx(0.5));
  CHECK(basis.eigenvalues()[2] == doctest::Approx(0.5));
  CHECK(basis.eigenvalues()[3] == doctest::Approx(1.0));
  check_basis_invariants(grid, basis);
}

TEST_CASE("Fully active grid has one basis function per cell") {
  protovalue::test_support::configure_deterministic_test_env();
  for (const auto &[w, h] : std::vector<std::pair<int, int>>{{1, 1}, {5, 1}, {4, 3}, {15, 15}}) {
    const GridGraph grid(w, h);
    const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);
    CHECK(basis.size() == w * h);
    CHECK(std::abs(basis.min_eigenvalue()) <= kTolMedium);
    check_basis_invariants(grid, basis);
  }
}

TEST_CASE("Eigenvectors satisfy the normalized Laplacian eigen-equation") {
  protovalue::test_support::configure_deterministic_test_env();
  const GridGraph grid = protovalue::test_support::make_two_rooms(9, 7);
  const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);
  check_basis_invariants(grid, basis);

  const auto sub = protovalue::ops::extract_active_subgraph(grid);
  const Eigen::MatrixXd L = protovalue::ops::dense_normalized_laplacian(sub);
  for (int k = 0; k < basis.size(); ++k) {
    const Eigen::VectorXd v = protovalue::test_support::restrict_to_active(basis, k);
    const Eigen::VectorXd residual = L * v - basis.eigenvalues()[k] * v;
    CHECK(residual.cwiseAbs().maxCoeff() <= kTolLoose);
  }
}

TEST_CASE("Disconnected regions each contribute a zero eigenvalue") {
  protovalue::test_support::configure_deterministic_test_env();
  const GridGraph grid = protovalue::test_support::make_split_rooms(9, 5);
  const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);
  check_basis_invariants(grid, basis);

  int zero_count = 0;
  for (int i = 0; i < basis.size(); ++i) {
    if (basis.eigenvalues()[i] <= kTolLoose) {
      ++zero_count;
    }
  }
  CHECK(zero_count == 2);
}

TEST_CASE("Deactivating every cell yields an empty basis") {
  protovalue::test_support::configure_deterministic_test_env();
  GridGraph grid(4, 4);
  grid.set_all(false);
  const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);

  CHECK(basis.size() == 0);
  CHECK(basis.width() == 4);
  CHECK_THROWS_AS((void)basis.at(0), std::out_of_range);
  CHECK_THROWS_AS((void)basis.min_eigenvalue(), std::out_of_range);
  CHECK_THROWS_AS((void)basis.max_eigenvalue(), std::out_of_range);
  CHECK(basis.diagnostics().used_mode == protovalue::data::SpectralSolveMode::None);
}

TEST_CASE("A lone active cell is a constant basis function with eigenvalue zero") {
  protovalue::test_support::configure_deterministic_test_env();
  GridGraph grid(3, 3);
  grid.set_all(false);
  grid.set_active(2, 1, true);
  const SpectralBasis basis = protovalue::ops::compute_pvf_basis(grid);

  REQUIRE(basis.size() == 1);
  const auto f = basis.at(0);
  CHECK(std::abs(f.eigenvalue) <= kTolMedium);
  for (int y = 0; y < 3; ++y) {
    for (int x = 0; x < 3; ++x) {
      CHECK(f.values(y, x) == ((x == 2 && y == 1) ? 1.0 : 0.0));
    }
  }
}

TEST_CASE("Repeated builds of the same grid are identical") {
  protovalue::test_support::configure_deterministic_test_env();
  GridGraph grid = protovalue::test_support::make_two_rooms(8, 8);
  const SpectralBasis first = protovalue::ops::compute_pvf_basis(grid);

  grid.set_active(0, 0, false);
  grid.set_active(0, 0, true);
  const SpectralBasis second = protovalue::ops::compute_pvf_basis(grid);

  REQUIRE(second.size() == first.size());
  CHECK(second.eigenvalues() == first.eigenvalues());
  CHECK(second.eigenvectors() == first.eigenvectors());
  CHECK(second.active_indices() == first.active_indices());
}

TEST_CASE("Normalization pins the largest-magnitude component to +1") {
  Eigen::MatrixXd vecs(4, 3);
  vecs << 0.5, 0.0, 0.5,    //
      -0.5, 0.0, -0.7,      //
      0.5, 0.0, 0.7,        //
      -0.5, 0.0, 0.1;
  protovalue::ops::normalize_eigenvectors(vecs);

  // Ties pick the first component in slot order.
  CHECK(vecs(0, 0) == 1.0);
  CHECK(vecs(1, 0) == doctest::Approx(-1.0));
  CHECK(vecs.col(1).isZero());
  CHECK(vecs(1, 2) == 1.0);
  CHECK(vecs(2, 2) == doctest::Approx(-1.0));
  CHECK(vecs(3, 2) == doctest::Approx(-0.1 / 0.7));
}

TEST_CASE("Sorting eigenpairs is stable and floors negative noise") {
  Eigen::VectorXd evals(4);
  evals << 0.5, -1e-15, 0.5, 0.1;
  Eigen::MatrixXd evecs = Eigen::MatrixXd::Identity(4, 4);
  protovalue::ops::sort_eigenpairs(evals, evecs);

  CHECK(evals[0] == 0.0);
  CHECK(evals[1] == 0.1);
  CHECK(evals[2] == 0.5);
  CHECK(evals[3] == 0.5);
  CHECK(evecs(1, 0) == 1.0);
  CHECK(evecs(3, 1) == 1.0);
  CHECK(evecs(0, 2) == 1.0);
  CHECK(evecs(2, 3) == 1.0);
}

TEST_CASE("Embedding scatters subgraph rows onto their grid cells") {
  protovalue::test_support::configure_deterministic_test_env();
  GridGraph grid(3, 2);
  grid.set_active(1, 0, false);
  grid.set_active(0, 1, false);
  const auto sub = protovalue::ops::extract_active_subgraph(grid);
  REQUIRE(sub.size() == 4);

  Eigen::MatrixXd vecs(4, 2);
  vecs << 1.0, -1.0, //
      2.0, -2.0,     //
      3.0, -3.0,     //
      4.0, -4.0;
  const Eigen::MatrixXd embedded = protovalue::ops::embed_eigenvectors(sub, grid.num_cells(), vecs);

  REQUIRE(embedded.rows() == 6);
  REQUIRE(embedded.cols() == 2);
  CHECK(embedded(0, 0) == 1.0);
  CHECK(embedded(1, 0) == 0.0);
  CHECK(embedded(2, 0) == 2.0);
  CHECK(embedded(3, 1) == 0.0);
  CHECK(embedded(4, 0) == 3.0);
  CHECK(embedded(5, 1) == -4.0);
}

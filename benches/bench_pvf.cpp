#include <benchmark/benchmark.h>

#include <cstdlib>

#include <protovalue/data/grid_graph.hpp>
#include <protovalue/ops/laplacian.hpp>
#include <protovalue/ops/spectral.hpp>

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() {
    setenv("PROTOVALUE_QUIET", "1", 1);
  }
} kBenchEnvSetup;

// Square room with a wall down the middle and a doorway at half height.
protovalue::data::GridGraph make_two_rooms(int side) {
  protovalue::data::GridGraph grid(side, side);
  for (int y = 0; y < side; ++y) {
    if (y != side / 2) {
      grid.set_active(side / 2, y, false);
    }
  }
  return grid;
}

void bench_subgraph_extract(benchmark::State &state) {
  const auto grid = make_two_rooms(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    const auto sub = protovalue::ops::extract_active_subgraph(grid);
    benchmark::DoNotOptimize(sub.values.data());
  }
}

void bench_full_basis(benchmark::State &state) {
  const auto grid = make_two_rooms(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    const auto basis = protovalue::ops::compute_pvf_basis(grid);
    benchmark::DoNotOptimize(basis.eigenvalues().data());
  }
}

void bench_truncated_basis_dense(benchmark::State &state) {
  setenv("PROTOVALUE_SOLVER", "dense", 1);
  const auto grid = make_two_rooms(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    const auto basis = protovalue::ops::compute_pvf_basis(grid, 16);
    benchmark::DoNotOptimize(basis.eigenvalues().data());
  }
  unsetenv("PROTOVALUE_SOLVER");
}

void bench_truncated_basis_lanczos(benchmark::State &state) {
  setenv("PROTOVALUE_SOLVER", "lanczos", 1);
  const auto grid = make_two_rooms(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    const auto basis = protovalue::ops::compute_pvf_basis(grid, 16);
    benchmark::DoNotOptimize(basis.eigenvalues().data());
  }
  unsetenv("PROTOVALUE_SOLVER");
}
} // namespace

BENCHMARK(bench_subgraph_extract)->Arg(15)->Arg(64);
BENCHMARK(bench_full_basis)->Arg(10)->Arg(15)->Arg(20);
BENCHMARK(bench_truncated_basis_dense)->Arg(20)->Arg(30);
BENCHMARK(bench_truncated_basis_lanczos)->Arg(20)->Arg(30);

BENCHMARK_MAIN();

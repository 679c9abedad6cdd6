#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace protovalue::core {

/// \brief Solver path used for truncated basis construction.
enum class SolverMode {
  Auto,
  Dense,
  Lanczos
};

/**
 * \brief Whether informational logging is enabled.
 *
 * Any value of `PROTOVALUE_QUIET` silences progress output on `std::cout`.
 * Failure and fallback lines on `std::cerr` are always emitted.
 * \return `true` unless `PROTOVALUE_QUIET` is set.
 */
inline bool verbose_from_env() { return std::getenv("PROTOVALUE_QUIET") == nullptr; }

/**
 * \brief Parse solver mode from `PROTOVALUE_SOLVER`.
 * \return Selected solver mode, `SolverMode::Auto` when unset or unknown.
 */
inline SolverMode solver_mode_from_env() {
  const char *raw = std::getenv("PROTOVALUE_SOLVER");
  if (raw == nullptr) {
    return SolverMode::Auto;
  }

  std::string value(raw);
  for (char &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (value == "dense") {
    return SolverMode::Dense;
  }
  if (value == "lanczos") {
    return SolverMode::Lanczos;
  }
  return SolverMode::Auto;
}

/**
 * \brief Active-cell threshold at which `SolverMode::Auto` switches to Lanczos.
 * \return Value of `PROTOVALUE_LANCZOS_MIN_CELLS`, or `400` when unset/invalid.
 */
inline int lanczos_min_cells_from_env() {
  const char *raw = std::getenv("PROTOVALUE_LANCZOS_MIN_CELLS");
  if (raw != nullptr) {
    const int requested = std::atoi(raw);
    if (requested > 0) {
      return requested;
    }
  }
  return 400;
}

} // namespace protovalue::core

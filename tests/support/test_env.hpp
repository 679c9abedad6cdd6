#pragma once

#include <cstdlib>

namespace protovalue::test_support {

inline void configure_deterministic_test_env() {
  setenv("PROTOVALUE_QUIET", "1", 1);
  unsetenv("PROTOVALUE_SOLVER");
  unsetenv("PROTOVALUE_LANCZOS_MIN_CELLS");
}

} // namespace protovalue::test_support

#pragma once

#include <optional>
#include <stdexcept>
#include <vector>

namespace protovalue::data {

/**
 * \brief Ordered-sequence slice with optional bounds and a signed step.
 *
 * Negative `start`/`stop` count from the end of the sequence and out-of-range
 * bounds saturate, so any slice is valid for any length except `step == 0`.
 */
struct Slice {
  std::optional<int> start;
  std::optional<int> stop;
  int step = 1;

  /**
   * \brief Resolve the slice against a sequence of `length` elements.
   * \return Selected indices in iteration order.
   * \throws std::invalid_argument when `step == 0`.
   */
  [[nodiscard]] std::vector<int> indices(int length) const {
    if (step == 0) {
      throw std::invalid_argument("Slice step cannot be zero");
    }

    const bool reverse = step < 0;
    const int lower = reverse ? -1 : 0;
    const int upper = reverse ? length - 1 : length;

    const auto resolve = [&](const std::optional<int> &bound, int fallback) {
      if (!bound) {
        return fallback;
      }
      int value = *bound;
      if (value < 0) {
        value += length;
        return value < lower ? lower : value;
      }
      return value > upper ? upper : value;
    };

    const int first = resolve(start, reverse ? upper : lower);
    const int last = resolve(stop, reverse ? lower : upper);

    std::vector<int> out;
    if (reverse) {
      for (long long i = first; i > last; i += step) {
        out.push_back(static_cast<int>(i));
      }
    } else {
      for (long long i = first; i < last; i += step) {
        out.push_back(static_cast<int>(i));
      }
    }
    return out;
  }
};

} // namespace protovalue::data

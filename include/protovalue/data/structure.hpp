#pragma once

#include <concepts>
#include <span>

namespace protovalue::data {

/**
 * \brief Concept for a cell graph the spectral builders can decompose.
 *
 * A valid graph type must expose:
 * - a fixed cell count and grid shape (`num_cells`, `width`, `height`)
 * - per-cell activation (`is_active_cell`)
 * - a sparse, symmetric neighbor table (`get_neighborhood`,
 *   `get_neighbor_weights`) with matching lengths per cell
 */
template <typename T>
concept CellGraph = requires(const T &ct, int cell) {
  { ct.num_cells() } -> std::convertible_to<int>;
  { ct.width() } -> std::convertible_to<int>;
  { ct.height() } -> std::convertible_to<int>;
  { ct.is_active_cell(cell) } -> std::convertible_to<bool>;
  { ct.get_neighborhood(cell) } -> std::convertible_to<std::span<const int>>;
  { ct.get_neighbor_weights(cell) } -> std::convertible_to<std::span<const double>>;
};

} // namespace protovalue::data

#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <protovalue/core/config.hpp>
#include <protovalue/data/grid_graph.hpp>
#include <protovalue/data/spectral_basis.hpp>

namespace protovalue::io {

// ==============================================================================
// MASK TEXT FORMAT
// ==============================================================================
// One line per grid row, top row first. Active cells: '.', '1', 'o'.
// Inactive cells: '#', '0', 'x'. Blank lines and lines starting with ';' are
// skipped. All rows must have the same width.

struct MaskRows {
  std::vector<std::string> rows;
  std::vector<int> line_numbers;
};

inline std::string_view trim(std::string_view s) {
  const auto first = s.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

inline MaskRows split_mask_rows(std::string_view text) {
  MaskRows out;
  int line_no = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    const size_t eol = text.find('\n', pos);
    const size_t end = (eol == std::string_view::npos) ? text.size() : eol;
    ++line_no;
    const std::string_view line = trim(text.substr(pos, end - pos));
    if (!line.empty() && line.front() != ';') {
      if (!out.rows.empty() && line.size() != out.rows.front().size()) {
        throw std::runtime_error("Mask line " + std::to_string(line_no) + ": expected " +
                                 std::to_string(out.rows.front().size()) +
                                 " cells, found " + std::to_string(line.size()));
      }
      out.rows.emplace_back(line);
      out.line_numbers.push_back(line_no);
    }
    if (eol == std::string_view::npos) {
      break;
    }
    pos = eol + 1;
  }

  if (out.rows.empty()) {
    throw std::runtime_error("Mask contains no grid rows");
  }
  return out;
}

inline bool parse_mask_cell(char c, int line_no) {
  switch (c) {
  case '.':
  case '1':
  case 'o':
    return true;
  case '#':
  case '0':
  case 'x':
    return false;
  default:
    throw std::runtime_error("Mask line " + std::to_string(line_no) +
                             ": unknown cell character '" + std::string(1, c) + "'");
  }
}

/**
 * \brief Overwrite the activation of `grid` from mask text.
 * \throws std::invalid_argument when the mask shape differs from the grid.
 * \throws std::runtime_error on malformed mask text; `grid` is left unchanged.
 */
inline void apply_mask(data::GridGraph &grid, std::string_view text) {
  const MaskRows mask = split_mask_rows(text);
  const int height = static_cast<int>(mask.rows.size());
  const int width = static_cast<int>(mask.rows.front().size());
  if (width != grid.width() || height != grid.height()) {
    throw std::invalid_argument("Mask is " + std::to_string(width) + "x" +
                                std::to_string(height) + " but grid is " +
                                std::to_string(grid.width()) + "x" +
                                std::to_string(grid.height()));
  }

  // Every character is validated before the grid is touched.
  std::vector<uint8_t> cells;
  cells.reserve(static_cast<size_t>(width) * static_cast<size_t>(height));
  for (int y = 0; y < height; ++y) {
    const std::string &row = mask.rows[static_cast<size_t>(y)];
    const int line_no = mask.line_numbers[static_cast<size_t>(y)];
    for (char c : row) {
      cells.push_back(parse_mask_cell(c, line_no) ? 1u : 0u);
    }
  }

  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      grid.set_active(x, y, cells[static_cast<size_t>(y) * width + x] != 0);
    }
  }
}

/**
 * \brief Build a grid whose shape and activation come from mask text.
 * \throws std::runtime_error on malformed mask text.
 */
inline data::GridGraph parse_mask(std::string_view text) {
  const MaskRows mask = split_mask_rows(text);
  data::GridGraph grid(static_cast<int>(mask.rows.front().size()),
                       static_cast<int>(mask.rows.size()));
  apply_mask(grid, text);
  return grid;
}

/**
 * \brief Read a mask file into a new grid.
 * \throws std::runtime_error when the file cannot be read or is malformed.
 */
inline data::GridGraph load_mask(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file.is_open())
    throw std::runtime_error("File not found: " + path.string());

  std::ostringstream buffer;
  buffer << file.rdbuf();

  if (core::verbose_from_env()) {
    std::cout << "[IO] Loading " << path.filename() << "...\n";
  }
  data::GridGraph grid = parse_mask(buffer.str());
  if (core::verbose_from_env()) {
    std::cout << "  - Grid:   " << grid.width() << "x" << grid.height() << "\n";
    std::cout << "  - Active: " << grid.num_active() << "\n";
  }
  return grid;
}

/**
 * \brief Print a basis function as a fixed-point table.
 * \param os Destination stream.
 * \param values `height x width` field.
 * \param grid Grid providing the activation of each cell; inactive cells print as `.`.
 * \param precision Digits after the decimal point.
 */
inline void write_field(std::ostream &os, const data::GridField &values,
                        const data::GridGraph &grid, int precision = 3) {
  const int column_width = precision + 4;
  const auto flags = os.flags();
  const auto old_precision = os.precision();
  os << std::fixed << std::setprecision(precision);
  for (int y = 0; y < values.rows(); ++y) {
    for (int x = 0; x < values.cols(); ++x) {
      if (x > 0) {
        os << ' ';
      }
      if (grid.contains(x, y) && grid.is_active(x, y)) {
        os << std::setw(column_width) << values(y, x);
      } else {
        os << std::setw(column_width) << '.';
      }
    }
    os << '\n';
  }
  os.flags(flags);
  os.precision(old_precision);
}

} // namespace protovalue::io

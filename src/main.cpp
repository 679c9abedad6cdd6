#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <protovalue/data/grid_graph.hpp>
#include <protovalue/io/mask.hpp>
#include <protovalue/ops/spectral.hpp>
#include <protovalue/session.hpp>

using namespace protovalue;

struct Config {
  int width = 15;
  int height = 15;
  std::string mask_path;
  std::vector<std::pair<int, int>> off_cells;

  int index = 0;
  std::optional<double> eigenvalue;
  int n_basis = -1;
  int precision = 3;
  bool list_eigenvalues = false;
};

static void print_usage() {
  std::cout << "Usage: ./build/protovalue-pvf [options]\n"
            << "  --width <int>\n"
            << "  --height <int>\n"
            << "  --mask <path>\n"
            << "  --off <x,y>          (repeatable)\n"
            << "  --index <int>\n"
            << "  --eigenvalue <float>\n"
            << "  --n-basis <int>\n"
            << "  --precision <int>\n"
            << "  --list\n";
}

static std::pair<int, int> parse_cell(const std::string &value) {
  const size_t comma = value.find(',');
  if (comma == std::string::npos) {
    throw std::invalid_argument("Expected x,y but got '" + value + "'");
  }
  return {std::stoi(value.substr(0, comma)), std::stoi(value.substr(comma + 1))};
}

static bool parse_args(int argc, char **argv, Config &cfg) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto require_value = [&](const char *name) -> const char * {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << name << "\n";
        std::exit(1);
      }
      ++i;
      return argv[i];
    };

    if (arg == "--help" || arg == "-h") {
      print_usage();
      return false;
    }
    if (arg == "--width") {
      cfg.width = std::stoi(require_value("--width"));
      continue;
    }
    if (arg == "--height") {
      cfg.height = std::stoi(require_value("--height"));
      continue;
    }
    if (arg == "--mask") {
      cfg.mask_path = require_value("--mask");
      continue;
    }
    if (arg == "--off") {
      cfg.off_cells.push_back(parse_cell(require_value("--off")));
      continue;
    }
    if (arg == "--index") {
      cfg.index = std::stoi(require_value("--index"));
      continue;
    }
    if (arg == "--eigenvalue") {
      cfg.eigenvalue = std::stod(require_value("--eigenvalue"));
      continue;
    }
    if (arg == "--n-basis") {
      cfg.n_basis = std::stoi(require_value("--n-basis"));
      continue;
    }
    if (arg == "--precision") {
      cfg.precision = std::stoi(require_value("--precision"));
      continue;
    }
    if (arg == "--list") {
      cfg.list_eigenvalues = true;
      continue;
    }
    std::cerr << "Unknown argument: " << arg << "\n";
    print_usage();
    return false;
  }

  return true;
}

static void print_eigenvalues(const data::SpectralBasis &basis) {
  for (int i = 0; i < basis.size(); ++i) {
    std::cout << std::format("  {:4d}  {:.6f}\n", i, basis.eigenvalues()[i]);
  }
}

static int run(const Config &cfg) {
  data::GridGraph grid = cfg.mask_path.empty() ? data::GridGraph(cfg.width, cfg.height)
                                               : io::load_mask(cfg.mask_path);
  for (const auto &[x, y] : cfg.off_cells) {
    grid.set_active(x, y, false);
  }

  if (cfg.n_basis >= 0) {
    const data::SpectralBasis basis = ops::compute_pvf_basis(grid, cfg.n_basis);
    std::cout << std::format("Smoothest {} of {} proto-value functions:\n", basis.size(),
                             grid.num_active());
    print_eigenvalues(basis);
    return 0;
  }

  Session session(std::move(grid));
  const data::SpectralBasis &basis = session.basis();
  if (basis.empty()) {
    std::cout << "No active cells; the basis is empty.\n";
    return 0;
  }

  std::cout << std::format("{} proto-value functions, eigenvalues in [{:.6f}, {:.6f}]\n",
                           basis.size(), basis.min_eigenvalue(), basis.max_eigenvalue());
  if (cfg.list_eigenvalues) {
    print_eigenvalues(basis);
  }

  if (cfg.eigenvalue) {
    session.select_eigenvalue(*cfg.eigenvalue);
  } else {
    session.select(cfg.index);
  }

  const data::BasisFunction pvf = session.current();
  std::cout << std::format("\nPVF {} (eigenvalue {:.6f}):\n", session.selected(),
                           pvf.eigenvalue);
  io::write_field(std::cout, pvf.values, session.grid(), cfg.precision);
  return 0;
}

int main(int argc, char **argv) {
  try {
    Config cfg;
    if (!parse_args(argc, argv, cfg)) {
      return 1;
    }
    return run(cfg);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

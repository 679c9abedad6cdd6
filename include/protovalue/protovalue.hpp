#pragma once

/// \file
/// \brief Umbrella header for the public protovalue API.

#include <protovalue/core/config.hpp>

#include <protovalue/data/grid_graph.hpp>
#include <protovalue/data/slice.hpp>
#include <protovalue/data/spectral_basis.hpp>
#include <protovalue/data/structure.hpp>

#include <protovalue/io/mask.hpp>

#include <protovalue/ops/laplacian.hpp>
#include <protovalue/ops/spectral.hpp>

#include <protovalue/session.hpp>

#pragma once

#include <utility>
#include <vector>

#include "zonegrid/grid_environment.hpp"
#include "zonegrid/polygon.hpp"
#include "zonegrid/zone.hpp"

namespace zonegrid {

struct RasterizeParams {
    double cell_size_m = 10.0;
    Bounds bounds;
    bool avoid_high_multiplier = false;
    double rolloff_distance_m = 0.0;
};

// (width, height), each at least 1.
std::pair<int, int> grid_dimensions(const Bounds& bounds, double cell_size_m);

// Point-samples every zone at cell centres. NO_FLY wins over COST, overlapping
// COST multipliers compose multiplicatively, and the optional rolloff softens
// the approach to high-cost zones. Throws std::invalid_argument for a
// non-positive cell size or non-finite bounds.
GridEnvironment rasterize_zones(const std::vector<Zone>& zones,
                                const std::vector<CostZoneType>& cost_types,
                                const RasterizeParams& params);

} // namespace zonegrid

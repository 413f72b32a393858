#include "zonegrid/rasterizer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "zonegrid/log.hpp"

namespace zonegrid {

namespace {

struct CompiledZone {
    const Zone* zone;
    Bounds bbox;
    double multiplier;
};

struct IndexRange {
    int min_col, max_col;
    int min_row, max_row;
};

int clamp_index(double v, int n) {
    double f = std::floor(v);
    if (f < 0) return 0;
    if (f > n - 1) return n - 1;
    return static_cast<int>(f);
}

IndexRange index_range(const Bounds& b, const Bounds& grid, double cell, int width, int height) {
    return IndexRange{
        clamp_index((b.min_x - grid.min_x) / cell, width),
        clamp_index((b.max_x - grid.min_x) / cell, width),
        clamp_index((b.min_y - grid.min_y) / cell, height),
        clamp_index((b.max_y - grid.min_y) / cell, height)
    };
}

double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

} // namespace

std::pair<int, int> grid_dimensions(const Bounds& bounds, double cell_size_m) {
    if (!(cell_size_m > 0) || !std::isfinite(cell_size_m)) {
        throw std::invalid_argument("cell_size_m must be a positive finite number");
    }
    if (!std::isfinite(bounds.min_x) || !std::isfinite(bounds.min_y) ||
        !std::isfinite(bounds.max_x) || !std::isfinite(bounds.max_y)) {
        throw std::invalid_argument("Planning bounds must be finite");
    }
    const double w = std::max(1.0, std::ceil(bounds.span_x() / cell_size_m));
    const double h = std::max(1.0, std::ceil(bounds.span_y() / cell_size_m));
    constexpr double max_side = static_cast<double>(std::numeric_limits<int>::max());
    if (!(w <= max_side) || !(h <= max_side)) {
        throw std::invalid_argument("Grid dimensions overflow at this cell size");
    }
    return {static_cast<int>(w), static_cast<int>(h)};
}

GridEnvironment rasterize_zones(const std::vector<Zone>& zones,
                                const std::vector<CostZoneType>& cost_types,
                                const RasterizeParams& params) {
    auto t0 = std::chrono::steady_clock::now();
    auto logger = log::get();

    const double cell = params.cell_size_m;
    const Bounds& bounds = params.bounds;
    auto [width, height] = grid_dimensions(bounds, cell);
    const size_t cell_count = static_cast<size_t>(width) * height;

    std::vector<uint8_t> blocked(cell_count, 0);
    std::vector<float> cost(cell_count, 1.0f);
    std::vector<uint8_t> exact_cost(cell_count, 0);

    // Cells cover [min, min + n*cell), which may extend past max.
    const Bounds extent{bounds.min_x, bounds.min_y,
                        bounds.min_x + width * cell, bounds.min_y + height * cell};

    const CostTypeTable types = index_cost_types(cost_types);

    std::vector<CompiledZone> compiled;
    compiled.reserve(zones.size());
    for (const auto& z : zones) {
        double multiplier = 1.0;
        if (z.kind == ZoneKind::Cost) {
            auto it = types.find(z.cost_type_id);
            if (it != types.end()) {
                multiplier = it->second.multiplier;
            } else {
                logger->warn("Zone {} references unknown cost type '{}', using multiplier 1",
                             z.id, z.cost_type_id);
            }
        }
        compiled.push_back(CompiledZone{&z, bbox(z.raster_shape()), multiplier});
    }

    for (const auto& entry : compiled) {
        if (!entry.bbox.intersects(extent)) continue;
        const Zone& z = *entry.zone;
        const MultiPolygon& polys = z.raster_shape();
        IndexRange r = index_range(entry.bbox, bounds, cell, width, height);

        for (int row = r.min_row; row <= r.max_row; row++) {
            const double y = bounds.min_y + (row + 0.5) * cell;
            const size_t base = static_cast<size_t>(row) * width;
            for (int col = r.min_col; col <= r.max_col; col++) {
                const size_t id = base + col;
                if (blocked[id]) continue;
                const double x = bounds.min_x + (col + 0.5) * cell;
                if (!point_in_any(x, y, polys)) continue;

                if (z.kind == ZoneKind::NoFly) {
                    blocked[id] = 1;
                } else {
                    cost[id] = static_cast<float>(cost[id] * entry.multiplier);
                    exact_cost[id] = 1;
                }
            }
        }
    }

    const double rolloff = params.rolloff_distance_m;
    if (params.avoid_high_multiplier && rolloff > 0) {
        std::vector<double> factor_sum(cell_count, 0.0);
        std::vector<uint32_t> factor_count(cell_count, 0);

        for (const auto& entry : compiled) {
            if (entry.zone->kind != ZoneKind::Cost || !(entry.multiplier > 1)) continue;
            const Bounds reach = entry.bbox.expanded(rolloff);
            if (!reach.intersects(extent)) continue;
            const MultiPolygon& polys = entry.zone->raster_shape();
            IndexRange r = index_range(reach, bounds, cell, width, height);

            for (int row = r.min_row; row <= r.max_row; row++) {
                const double y = bounds.min_y + (row + 0.5) * cell;
                const size_t base = static_cast<size_t>(row) * width;
                for (int col = r.min_col; col <= r.max_col; col++) {
                    const size_t id = base + col;
                    if (blocked[id] || exact_cost[id]) continue;
                    const double x = bounds.min_x + (col + 0.5) * cell;
                    if (point_in_any(x, y, polys)) continue;

                    const double d = distance_to_polygons(x, y, polys);
                    if (!std::isfinite(d) || d > rolloff) continue;
                    const double factor = 1 + (entry.multiplier - 1) * (1 - clamp01(d / rolloff));
                    if (factor > 1) {
                        factor_sum[id] += factor;
                        factor_count[id] += 1;
                    }
                }
            }
        }

        for (size_t id = 0; id < cell_count; id++) {
            if (factor_count[id] == 0 || blocked[id]) continue;
            const double avg = factor_sum[id] / factor_count[id];
            if (avg > 1) cost[id] = static_cast<float>(cost[id] * avg);
        }
    }

    GridEnvironment env(cell, bounds, width, height, std::move(blocked), std::move(cost));

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0);
    logger->debug("Rasterized {} zones onto {}x{} grid ({} blocked) in {:.2f} ms",
                  zones.size(), width, height, env.blocked_count(), elapsed.count());
    return env;
}

} // namespace zonegrid

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "zonegrid/buffer.hpp"
#include "zonegrid/grid_environment.hpp"
#include "zonegrid/problem.hpp"
#include "zonegrid/projection.hpp"
#include "zonegrid/rasterizer.hpp"
#include "zonegrid/zone.hpp"

namespace zonegrid {

constexpr double MIN_ZONE_MULTIPLIER = 0.1;
constexpr double MAX_ZONE_MULTIPLIER = 50.0;

struct LatLng {
    double lat;
    double lng;
};

// One planning request: area, resolution and zones. Zone geometry is already
// projected, and NO_FLY zones are buffered by no_fly_buffer_m.
struct Scene {
    GeoRect planning_bounds{};
    double resolution_m = 10.0;
    double no_fly_buffer_m = DEFAULT_NO_FLY_BUFFER_M;
    size_t max_cells = DEFAULT_MAX_CELLS;
    bool avoid_high_multiplier = false;
    double rolloff_distance_m = 0.0;
    std::vector<CostZoneType> cost_zone_types;
    std::vector<Zone> zones;
    std::optional<LatLng> start;
    std::optional<LatLng> goal;
};

// Accepts a GeoJSON Polygon, MultiPolygon, or a Feature wrapping either.
// Coordinates are [lng, lat]; the result is in planar metres.
MultiPolygon parse_geojson_shape(const nlohmann::json& j);

// Throws SceneError on malformed input.
Scene parse_scene(const nlohmann::json& j);
Scene load_scene(const std::filesystem::path& path);

RasterizeParams raster_params(const Scene& scene);

// Enforces max_cells, then rasterizes. Throws InputTooLarge.
GridEnvironment build_environment(const Scene& scene);

} // namespace zonegrid

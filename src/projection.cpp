#include "zonegrid/projection.hpp"

#include <algorithm>
#include <cmath>

namespace zonegrid {

std::pair<double, double> lonlat_to_mercator(double lon, double lat) {
    double x = deg2rad(lon) * EARTH_RADIUS_M;
    double y = std::log(std::tan(M_PI / 4 + deg2rad(lat) / 2)) * EARTH_RADIUS_M;
    return {x, y};
}

std::pair<double, double> mercator_to_lonlat(double x, double y) {
    double lon = rad2deg(x / EARTH_RADIUS_M);
    double lat = rad2deg(2 * std::atan(std::exp(y / EARTH_RADIUS_M)) - M_PI / 2);
    return {lon, lat};
}

double mercator_scale(double lat) {
    return 1.0 / std::cos(deg2rad(lat));
}

Bounds to_planning_bounds(const GeoRect& rect) {
    auto [sw_x, sw_y] = lonlat_to_mercator(rect.west, rect.south);
    auto [ne_x, ne_y] = lonlat_to_mercator(rect.east, rect.north);
    return Bounds{
        std::min(sw_x, ne_x),
        std::min(sw_y, ne_y),
        std::max(sw_x, ne_x),
        std::max(sw_y, ne_y)
    };
}

Polygon project_polygon(const Polygon& lonlat_rings) {
    Polygon out;
    out.reserve(lonlat_rings.size());
    for (const auto& ring : lonlat_rings) {
        Ring projected;
        projected.reserve(ring.size());
        for (const auto& p : ring) {
            auto [x, y] = lonlat_to_mercator(p.x, p.y);
            projected.push_back({x, y});
        }
        out.push_back(std::move(projected));
    }
    return out;
}

MultiPolygon project_multi_polygon(const MultiPolygon& lonlat_polys) {
    MultiPolygon out;
    out.reserve(lonlat_polys.size());
    for (const auto& poly : lonlat_polys) {
        out.push_back(project_polygon(poly));
    }
    return out;
}

} // namespace zonegrid

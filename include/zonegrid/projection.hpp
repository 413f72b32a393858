#pragma once

#include <cmath>
#include <utility>

#include "zonegrid/polygon.hpp"

namespace zonegrid {

constexpr double EARTH_RADIUS_M = 6378137.0;

// Geographic rectangle in degrees.
struct GeoRect {
    double south;
    double west;
    double north;
    double east;
};

// Spherical Web-Mercator (EPSG:3857). Distances in (x, y) are treated as
// Euclidean metres, which holds well at city/campus scale.
std::pair<double, double> lonlat_to_mercator(double lon, double lat);
std::pair<double, double> mercator_to_lonlat(double x, double y);

// Projected metres per ground metre at the given latitude.
double mercator_scale(double lat);

Bounds to_planning_bounds(const GeoRect& rect);

// Rings are [lon, lat] pairs in degrees.
Polygon project_polygon(const Polygon& lonlat_rings);
MultiPolygon project_multi_polygon(const MultiPolygon& lonlat_polys);

inline double deg2rad(double deg) { return deg * M_PI / 180.0; }
inline double rad2deg(double rad) { return rad * 180.0 / M_PI; }

} // namespace zonegrid

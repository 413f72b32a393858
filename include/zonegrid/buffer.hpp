#pragma once

#include "zonegrid/polygon.hpp"

namespace zonegrid {

constexpr double DEFAULT_NO_FLY_BUFFER_M = 10.0;
constexpr int BUFFER_POINTS_PER_CIRCLE = 36;

// Expands every polygon outward by margin_m ground metres. ground_scale is the
// number of planar units per ground metre (see mercator_scale). Polygons whose
// outer ring has fewer than 3 points are returned unchanged, as is everything
// when margin_m <= 0. Overlapping results are dissolved into one multi-polygon.
MultiPolygon buffer_polygons(const MultiPolygon& polys, double margin_m, double ground_scale = 1.0);

} // namespace zonegrid

#pragma once

#include <limits>
#include <vector>

namespace zonegrid {

struct Vec2 {
    double x;
    double y;
};

using Ring = std::vector<Vec2>;              // implicitly closed
using Polygon = std::vector<Ring>;           // [outer, hole1, hole2, ...]
using MultiPolygon = std::vector<Polygon>;

// Axis-aligned rectangle in planar metres. A default-constructed box is empty
// (min > max) so that extending it with the first point yields that point.
struct Bounds {
    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    bool empty() const { return !(min_x <= max_x && min_y <= max_y); }
    double span_x() const { return max_x - min_x; }
    double span_y() const { return max_y - min_y; }

    void extend(const Vec2& p);
    Bounds expanded(double d) const;
    bool intersects(const Bounds& other) const;
};

Bounds bbox(const Ring& ring);
Bounds bbox(const Polygon& poly);
Bounds bbox(const MultiPolygon& polys);

bool point_in_ring(double x, double y, const Ring& ring) noexcept;
bool point_in_polygon(double x, double y, const Polygon& poly) noexcept;
bool point_in_any(double x, double y, const MultiPolygon& polys) noexcept;

double point_segment_distance(double px, double py,
                              double ax, double ay,
                              double bx, double by) noexcept;

// Minimum distance from (x, y) to any edge of any ring. +inf without edges.
double distance_to_ring(double x, double y, const Ring& ring) noexcept;
double distance_to_polygons(double x, double y, const MultiPolygon& polys) noexcept;

} // namespace zonegrid

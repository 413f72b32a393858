#include "zonegrid/polygon.hpp"

#include <algorithm>
#include <cmath>

namespace zonegrid {

namespace {
constexpr double HORIZONTAL_EDGE_EPS = 1e-12;
constexpr double INF = std::numeric_limits<double>::infinity();
}

void Bounds::extend(const Vec2& p) {
    min_x = std::min(min_x, p.x);
    min_y = std::min(min_y, p.y);
    max_x = std::max(max_x, p.x);
    max_y = std::max(max_y, p.y);
}

Bounds Bounds::expanded(double d) const {
    if (empty()) return *this;
    return Bounds{min_x - d, min_y - d, max_x + d, max_y + d};
}

bool Bounds::intersects(const Bounds& other) const {
    if (empty() || other.empty()) return false;
    return min_x <= other.max_x && other.min_x <= max_x &&
           min_y <= other.max_y && other.min_y <= max_y;
}

Bounds bbox(const Ring& ring) {
    Bounds b;
    for (const auto& p : ring) b.extend(p);
    return b;
}

Bounds bbox(const Polygon& poly) {
    Bounds b;
    for (const auto& ring : poly) {
        for (const auto& p : ring) b.extend(p);
    }
    return b;
}

Bounds bbox(const MultiPolygon& polys) {
    Bounds b;
    for (const auto& poly : polys) {
        for (const auto& ring : poly) {
            for (const auto& p : ring) b.extend(p);
        }
    }
    return b;
}

bool point_in_ring(double x, double y, const Ring& ring) noexcept {
    bool inside = false;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const double xi = ring[i].x, yi = ring[i].y;
        const double xj = ring[j].x, yj = ring[j].y;

        if ((yi > y) == (yj > y)) continue;
        double dy = yj - yi;
        if (dy == 0.0) dy = HORIZONTAL_EDGE_EPS;
        if (x < (xj - xi) * (y - yi) / dy + xi) inside = !inside;
    }
    return inside;
}

bool point_in_polygon(double x, double y, const Polygon& poly) noexcept {
    if (poly.empty()) return false;
    if (!point_in_ring(x, y, poly[0])) return false;
    for (size_t h = 1; h < poly.size(); h++) {
        if (point_in_ring(x, y, poly[h])) return false;
    }
    return true;
}

bool point_in_any(double x, double y, const MultiPolygon& polys) noexcept {
    for (const auto& poly : polys) {
        if (point_in_polygon(x, y, poly)) return true;
    }
    return false;
}

double point_segment_distance(double px, double py,
                              double ax, double ay,
                              double bx, double by) noexcept {
    const double abx = bx - ax;
    const double aby = by - ay;
    const double apx = px - ax;
    const double apy = py - ay;
    const double denom = abx * abx + aby * aby;
    if (denom <= 0) return std::hypot(apx, apy);

    const double t = std::clamp((apx * abx + apy * aby) / denom, 0.0, 1.0);
    return std::hypot(px - (ax + t * abx), py - (ay + t * aby));
}

double distance_to_ring(double x, double y, const Ring& ring) noexcept {
    if (ring.size() < 2) return INF;
    double best = INF;
    for (size_t i = 0; i < ring.size(); i++) {
        const Vec2& a = ring[i];
        const Vec2& b = ring[(i + 1) % ring.size()];
        best = std::min(best, point_segment_distance(x, y, a.x, a.y, b.x, b.y));
    }
    return best;
}

double distance_to_polygons(double x, double y, const MultiPolygon& polys) noexcept {
    double best = INF;
    for (const auto& poly : polys) {
        for (const auto& ring : poly) {
            best = std::min(best, distance_to_ring(x, y, ring));
        }
    }
    return best;
}

} // namespace zonegrid

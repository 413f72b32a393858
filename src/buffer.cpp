#include "zonegrid/buffer.hpp"

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>

namespace bg = boost::geometry;

namespace zonegrid {

namespace {
using BgPoint = bg::model::d2::point_xy<double>;
using BgPolygon = bg::model::polygon<BgPoint>;
using BgMultiPolygon = bg::model::multi_polygon<BgPolygon>;

template<typename BgRing>
void copy_ring(const Ring& in, BgRing& out) {
    out.reserve(in.size() + 1);
    for (const auto& p : in) out.push_back(BgPoint(p.x, p.y));
}

Ring to_ring(const BgPolygon::ring_type& in) {
    Ring out;
    out.reserve(in.size());
    for (const auto& p : in) out.push_back({p.x(), p.y()});
    return out;
}

BgPolygon to_bg(const Polygon& poly) {
    BgPolygon out;
    copy_ring(poly[0], out.outer());
    for (size_t h = 1; h < poly.size(); h++) {
        if (poly[h].size() < 3) continue;
        out.inners().emplace_back();
        copy_ring(poly[h], out.inners().back());
    }
    bg::correct(out);
    return out;
}
}

MultiPolygon buffer_polygons(const MultiPolygon& polys, double margin_m, double ground_scale) {
    if (!(margin_m > 0)) return polys;

    MultiPolygon result;
    BgMultiPolygon input;
    for (const auto& poly : polys) {
        if (poly.empty() || poly[0].size() < 3) {
            result.push_back(poly);
            continue;
        }
        input.push_back(to_bg(poly));
    }
    if (input.empty()) return result;

    const double distance = margin_m * ground_scale;
    bg::strategy::buffer::distance_symmetric<double> distance_strategy(distance);
    bg::strategy::buffer::join_round join_strategy(BUFFER_POINTS_PER_CIRCLE);
    bg::strategy::buffer::end_round end_strategy(BUFFER_POINTS_PER_CIRCLE);
    bg::strategy::buffer::point_circle point_strategy(BUFFER_POINTS_PER_CIRCLE);
    bg::strategy::buffer::side_straight side_strategy;

    BgMultiPolygon buffered;
    bg::buffer(input, buffered, distance_strategy, side_strategy,
               join_strategy, end_strategy, point_strategy);

    for (const auto& bp : buffered) {
        Polygon poly;
        poly.push_back(to_ring(bp.outer()));
        for (const auto& inner : bp.inners()) poly.push_back(to_ring(inner));
        result.push_back(std::move(poly));
    }
    return result;
}

} // namespace zonegrid

#include "zonegrid/zone.hpp"

#include "zonegrid/buffer.hpp"
#include "zonegrid/projection.hpp"

namespace zonegrid {

const char* to_string(ZoneKind kind) {
    return kind == ZoneKind::NoFly ? "NO_FLY" : "COST";
}

Zone make_no_fly_zone(std::string id, std::string name, MultiPolygon shape,
                      double buffer_m) {
    Zone z;
    z.id = std::move(id);
    z.name = std::move(name);
    z.kind = ZoneKind::NoFly;

    double scale = 1.0;
    Bounds b = bbox(shape);
    if (!b.empty()) {
        double lat = mercator_to_lonlat(0.0, (b.min_y + b.max_y) / 2).second;
        scale = mercator_scale(lat);
    }
    z.buffered = buffer_polygons(shape, buffer_m, scale);
    z.shape = std::move(shape);
    return z;
}

Zone make_cost_zone(std::string id, std::string name, std::string cost_type_id,
                    MultiPolygon shape) {
    Zone z;
    z.id = std::move(id);
    z.name = std::move(name);
    z.kind = ZoneKind::Cost;
    z.shape = std::move(shape);
    z.cost_type_id = std::move(cost_type_id);
    return z;
}

CostTypeTable index_cost_types(const std::vector<CostZoneType>& types) {
    CostTypeTable table;
    for (const auto& t : types) table[t.id] = t;
    return table;
}

} // namespace zonegrid

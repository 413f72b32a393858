#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "zonegrid/polygon.hpp"

namespace zonegrid {

enum class ZoneKind { NoFly, Cost };

const char* to_string(ZoneKind kind);

struct CostZoneType {
    std::string id;
    std::string name;
    double multiplier = 1.0;   // >1 discourages, <1 encourages
    std::string color;         // display only
};

// Geometry is planar. For NO_FLY zones `buffered` is what gets rasterized
// (falling back to `shape` when unset); COST zones rasterize `shape`.
struct Zone {
    std::string id;
    std::string name;
    ZoneKind kind = ZoneKind::NoFly;
    MultiPolygon shape;
    MultiPolygon buffered;
    std::string cost_type_id;

    const MultiPolygon& raster_shape() const {
        return kind == ZoneKind::NoFly && !buffered.empty() ? buffered : shape;
    }
};

// Buffers `shape` by buffer_m ground metres, correcting for Mercator scale at
// the shape's latitude.
Zone make_no_fly_zone(std::string id, std::string name, MultiPolygon shape,
                      double buffer_m);
Zone make_cost_zone(std::string id, std::string name, std::string cost_type_id,
                    MultiPolygon shape);

using CostTypeTable = std::unordered_map<std::string, CostZoneType>;

CostTypeTable index_cost_types(const std::vector<CostZoneType>& types);

} // namespace zonegrid

#include "zonegrid/scene.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

#include "zonegrid/errors.hpp"
#include "zonegrid/log.hpp"

namespace zonegrid {

using json = nlohmann::json;

namespace {

Polygon parse_polygon_coords(const json& rings) {
    if (!rings.is_array()) throw SceneError("Polygon coordinates must be an array of rings");
    Polygon poly;
    for (const auto& ring : rings) {
        if (!ring.is_array()) throw SceneError("Polygon ring must be an array of positions");
        Ring out;
        out.reserve(ring.size());
        for (const auto& pos : ring) {
            if (!pos.is_array() || pos.size() < 2) {
                throw SceneError("Position must be [lng, lat]");
            }
            out.push_back({pos[0].get<double>(), pos[1].get<double>()});
        }
        poly.push_back(std::move(out));
    }
    return poly;
}

GeoRect parse_geo_rect(const json& j) {
    GeoRect r{
        j.at("south").get<double>(),
        j.at("west").get<double>(),
        j.at("north").get<double>(),
        j.at("east").get<double>()
    };
    for (double lat : {r.south, r.north}) {
        if (!(lat > -90.0 && lat < 90.0)) {
            throw SceneError("Planning bounds latitude must lie strictly between -90 and 90");
        }
    }
    if (!std::isfinite(r.west) || !std::isfinite(r.east)) {
        throw SceneError("Planning bounds longitude must be finite");
    }
    return r;
}

LatLng parse_lat_lng(const json& j) {
    return LatLng{j.at("lat").get<double>(), j.at("lng").get<double>()};
}

CostZoneType parse_cost_type(const json& j) {
    CostZoneType t;
    t.id = j.at("id").get<std::string>();
    t.name = j.value("name", t.id);
    t.multiplier = j.at("multiplier").get<double>();
    t.color = j.value("color", "");
    if (!(t.multiplier > 0) || !std::isfinite(t.multiplier)) {
        throw SceneError("Cost zone type " + t.id + " needs a positive multiplier");
    }
    return t;
}

} // namespace

MultiPolygon parse_geojson_shape(const json& j) {
    const std::string type = j.value("type", "");
    if (type == "Feature") {
        if (!j.contains("geometry")) throw SceneError("Feature has no geometry");
        return parse_geojson_shape(j["geometry"]);
    }

    MultiPolygon lonlat;
    if (type == "Polygon") {
        lonlat.push_back(parse_polygon_coords(j.at("coordinates")));
    } else if (type == "MultiPolygon") {
        for (const auto& poly : j.at("coordinates")) {
            lonlat.push_back(parse_polygon_coords(poly));
        }
    } else {
        throw SceneError("Unsupported geometry type '" + type + "'");
    }
    return project_multi_polygon(lonlat);
}

Scene parse_scene(const json& j) {
    Scene scene;
    try {
        scene.planning_bounds = parse_geo_rect(j.at("planning_bounds"));
        scene.resolution_m = j.value("resolution_m", scene.resolution_m);
        scene.no_fly_buffer_m = j.value("no_fly_buffer_m", scene.no_fly_buffer_m);
        if (j.contains("max_cells")) {
            const json& cap = j["max_cells"];
            if (!cap.is_number_unsigned() || cap.get<size_t>() == 0) {
                throw SceneError("max_cells must be a positive integer");
            }
            scene.max_cells = cap.get<size_t>();
        }
        scene.avoid_high_multiplier = j.value("avoid_high_multiplier", scene.avoid_high_multiplier);
        scene.rolloff_distance_m = j.value("rolloff_distance_m", scene.rolloff_distance_m);

        if (!(scene.resolution_m > 0)) throw SceneError("resolution_m must be positive");
        if (scene.no_fly_buffer_m < 0) throw SceneError("no_fly_buffer_m must be >= 0");
        if (scene.rolloff_distance_m < 0) throw SceneError("rolloff_distance_m must be >= 0");

        for (const auto& t : j.value("cost_zone_types", json::array())) {
            scene.cost_zone_types.push_back(parse_cost_type(t));
        }

        for (const auto& z : j.value("zones", json::array())) {
            std::string id = z.at("id").get<std::string>();
            std::string name = z.value("name", id);
            const std::string type = z.at("type").get<std::string>();
            MultiPolygon shape = parse_geojson_shape(z.at("shape"));

            if (type == "NO_FLY") {
                scene.zones.push_back(make_no_fly_zone(std::move(id), std::move(name),
                                                       std::move(shape), scene.no_fly_buffer_m));
            } else if (type == "COST") {
                std::string type_id;
                if (z.contains("cost_type_id")) {
                    type_id = z["cost_type_id"].get<std::string>();
                } else if (z.contains("multiplier")) {
                    // Saved states carry the multiplier on the zone itself.
                    type_id = id + ":inline";
                    double m = std::clamp(z["multiplier"].get<double>(),
                                          MIN_ZONE_MULTIPLIER, MAX_ZONE_MULTIPLIER);
                    scene.cost_zone_types.push_back(CostZoneType{type_id, name, m, ""});
                } else {
                    throw SceneError("Cost zone " + id + " needs cost_type_id or multiplier");
                }
                scene.zones.push_back(make_cost_zone(std::move(id), std::move(name),
                                                     std::move(type_id), std::move(shape)));
            } else {
                throw SceneError("Zone " + id + " has unknown type '" + type + "'");
            }
        }

        if (j.contains("start") && !j["start"].is_null()) scene.start = parse_lat_lng(j["start"]);
        if (j.contains("goal") && !j["goal"].is_null()) scene.goal = parse_lat_lng(j["goal"]);
    } catch (const json::exception& e) {
        throw SceneError(std::string("Malformed scene: ") + e.what());
    }
    return scene;
}

Scene load_scene(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) throw SceneError("Cannot open " + path.string());

    json j;
    try {
        f >> j;
    } catch (const json::exception& e) {
        throw SceneError("Cannot parse " + path.string() + ": " + e.what());
    }
    Scene scene = parse_scene(j);
    log::get()->debug("Loaded scene {} with {} zones and {} cost types",
                      path.string(), scene.zones.size(), scene.cost_zone_types.size());
    return scene;
}

RasterizeParams raster_params(const Scene& scene) {
    RasterizeParams params;
    params.cell_size_m = scene.resolution_m;
    params.bounds = to_planning_bounds(scene.planning_bounds);
    params.avoid_high_multiplier = scene.avoid_high_multiplier;
    params.rolloff_distance_m = scene.rolloff_distance_m;
    return params;
}

GridEnvironment build_environment(const Scene& scene) {
    RasterizeParams params = raster_params(scene);
    check_cell_cap(params.bounds, params.cell_size_m, scene.max_cells);
    return rasterize_zones(scene.zones, scene.cost_zone_types, params);
}

} // namespace zonegrid

#include "zonegrid/wire.hpp"

#include <cmath>
#include <limits>

#include "zonegrid/errors.hpp"

namespace zonegrid {

using json = nlohmann::json;

void to_json(json& j, const Bounds& b) {
    j = json{{"min_x", b.min_x}, {"min_y", b.min_y}, {"max_x", b.max_x}, {"max_y", b.max_y}};
}

void from_json(const json& j, Bounds& b) {
    b.min_x = j.at("min_x").get<double>();
    b.min_y = j.at("min_y").get<double>();
    b.max_x = j.at("max_x").get<double>();
    b.max_y = j.at("max_y").get<double>();
}

void to_json(json& j, const GridProblem& p) {
    json blocked = json::array();
    for (uint8_t b : p.blocked) blocked.push_back(b ? 1 : 0);

    json cost = json::array();
    for (float m : p.cost_multiplier) cost.push_back(std::isfinite(m) ? m : 1.0f);

    j = json{
        {"width", p.width},
        {"height", p.height},
        {"cell_size_m", p.cell_size_m},
        {"bounds", p.bounds},
        {"start", p.start},
        {"goal", p.goal},
        {"blocked", std::move(blocked)},
        {"cost_multiplier", std::move(cost)}
    };
}

void from_json(const json& j, GridProblem& p) {
    p.width = j.at("width").get<int>();
    p.height = j.at("height").get<int>();
    p.cell_size_m = j.at("cell_size_m").get<double>();
    p.bounds = j.at("bounds").get<Bounds>();
    p.start = j.at("start").get<CellId>();
    p.goal = j.at("goal").get<CellId>();

    const json& blocked = j.at("blocked");
    p.blocked.clear();
    p.blocked.reserve(blocked.size());
    for (const auto& v : blocked) {
        p.blocked.push_back(v.is_boolean() ? v.get<bool>() : v.get<int>() != 0);
    }

    const json& cost = j.at("cost_multiplier");
    p.cost_multiplier.clear();
    p.cost_multiplier.reserve(cost.size());
    for (const auto& v : cost) {
        p.cost_multiplier.push_back(v.is_null() ? 1.0f : v.get<float>());
    }

    validate(p);
}

void to_json(json& j, const RunOptions& o) {
    j = json{
        {"return_visited", o.return_visited},
        {"max_visited", o.max_visited},
        {"wind_enabled", o.wind_enabled},
        {"wind_direction_deg", o.wind_direction_deg},
        {"wind_speed_ms", o.wind_speed_ms},
        {"drone_airspeed_ms", o.drone_airspeed_ms}
    };
}

void from_json(const json& j, RunOptions& o) {
    o.return_visited = j.value("return_visited", false);
    o.max_visited = j.value("max_visited", DEFAULT_MAX_VISITED);
    if (o.max_visited < 0) throw InvalidProblem("max_visited must be >= 0");
    o.wind_enabled = j.value("wind_enabled", false);
    o.wind_direction_deg = j.value("wind_direction_deg", 0.0);
    o.wind_speed_ms = j.value("wind_speed_ms", 0.0);
    o.drone_airspeed_ms = j.value("drone_airspeed_ms", DEFAULT_DRONE_AIRSPEED_MS);
    if (!std::isfinite(o.wind_direction_deg) || !std::isfinite(o.wind_speed_ms) || o.wind_speed_ms < 0) {
        throw InvalidProblem("wind_direction_deg and wind_speed_ms must be finite, speed >= 0");
    }
    if (!(o.drone_airspeed_ms > 0) || !std::isfinite(o.drone_airspeed_ms)) {
        throw InvalidProblem("drone_airspeed_ms must be positive");
    }
}

void to_json(json& j, const RunRequest& r) {
    j = json{{"algorithm_id", r.algorithm_id}, {"problem", r.problem}};
    if (r.options) j["options"] = *r.options;
}

void from_json(const json& j, RunRequest& r) {
    r.algorithm_id = j.at("algorithm_id").get<std::string>();
    r.problem = j.at("problem").get<GridProblem>();
    if (j.contains("options") && !j["options"].is_null()) {
        r.options = j["options"].get<RunOptions>();
    } else {
        r.options.reset();
    }
}

void to_json(json& j, const RunResponse& r) {
    j = json{
        {"path", r.path},
        {"visited", r.visited},
        {"expanded", r.expanded},
        {"runtime_ms", r.runtime_ms}
    };
    if (std::isfinite(r.cost)) {
        j["cost"] = r.cost;
    } else {
        j["cost"] = nullptr;
    }
}

void from_json(const json& j, RunResponse& r) {
    r.path = j.at("path").get<std::vector<CellId>>();
    r.visited = j.value("visited", std::vector<CellId>{});
    r.expanded = j.at("expanded").get<long long>();
    const json& cost = j.at("cost");
    r.cost = cost.is_null() ? std::numeric_limits<double>::infinity() : cost.get<double>();
    r.runtime_ms = j.value("runtime_ms", 0.0);
}

void to_json(json& j, const AlgorithmInfo& info) {
    j = json{{"id", info.id}, {"name", info.name}, {"description", info.description}};
}

void from_json(const json& j, AlgorithmInfo& info) {
    info.id = j.at("id").get<std::string>();
    info.name = j.at("name").get<std::string>();
    info.description = j.value("description", "");
}

RunRequest parse_run_request(const std::string& text) {
    try {
        return json::parse(text).get<RunRequest>();
    } catch (const json::exception& e) {
        throw InvalidProblem(std::string("Malformed run request: ") + e.what());
    }
}

RunResponse parse_run_response(const std::string& text) {
    try {
        return json::parse(text).get<RunResponse>();
    } catch (const json::exception& e) {
        throw InvalidProblem(std::string("Malformed run response: ") + e.what());
    }
}

} // namespace zonegrid

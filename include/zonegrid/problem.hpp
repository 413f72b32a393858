#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "zonegrid/grid_environment.hpp"
#include "zonegrid/polygon.hpp"

namespace zonegrid {

constexpr size_t DEFAULT_MAX_CELLS = 250000;
constexpr int DEFAULT_MAX_VISITED = 50000;

constexpr double DEFAULT_DRONE_AIRSPEED_MS = 10.0;

// Wind fields are advisory; only wind-aware algorithms read them.
// wind_direction_deg is where the wind blows from, clockwise from north.
struct RunOptions {
    bool return_visited = false;
    int max_visited = DEFAULT_MAX_VISITED;
    bool wind_enabled = false;
    double wind_direction_deg = 0.0;
    double wind_speed_ms = 0.0;
    double drone_airspeed_ms = DEFAULT_DRONE_AIRSPEED_MS;
};

// Path is empty and cost is +inf iff no route exists.
struct AlgorithmResult {
    std::vector<CellId> path;
    std::vector<CellId> visited;
    long long expanded = 0;
    double cost = 0.0;
};

// Single-source single-target routing problem handed to an algorithm.
// Algorithms must treat the arrays as read-only.
struct GridProblem {
    int width = 0;
    int height = 0;
    double cell_size_m = 0.0;
    Bounds bounds;
    CellId start = 0;
    CellId goal = 0;
    std::vector<uint8_t> blocked;
    std::vector<float> cost_multiplier;

    size_t size() const { return static_cast<size_t>(width) * height; }
    bool in_bounds(int col, int row) const {
        return col >= 0 && row >= 0 && col < width && row < height;
    }
    CellId to_id(int col, int row) const { return row * width + col; }
    std::pair<int, int> col_row(CellId id) const {
        const int row = id / width;
        return {id - row * width, row};
    }
    Vec2 cell_center(CellId id) const;

    bool is_blocked(CellId id) const { return blocked[id] != 0; }
    double multiplier(CellId id) const { return effective_multiplier(cost_multiplier[id]); }
    double step_cost(CellId to, double step_distance_m) const {
        return step_distance_m * multiplier(to);
    }
    NeighborList neighbors8(CellId id) const {
        return zonegrid::neighbors8(width, height, cell_size_m, blocked, id);
    }

    // Straight-line distance to the goal. Pass the smallest multiplier on the
    // grid when it can drop below 1 so the estimate stays admissible; values
    // that are non-finite or <= 0 are ignored.
    double heuristic_euclidean_m(CellId id, std::optional<double> min_multiplier = std::nullopt) const;

    // Smallest positive finite multiplier, or 1 when there is none.
    double min_cost_multiplier() const;
};

// Throws InvalidProblem when dimensions, array lengths or endpoints are off.
void validate(const GridProblem& problem);

// Throws InputTooLarge when the grid for bounds/resolution exceeds cap cells.
size_t check_cell_cap(const Bounds& bounds, double cell_size_m, size_t cap = DEFAULT_MAX_CELLS);

// Maps planar endpoints onto env and copies its arrays. Throws OutOfBounds or
// BlockedEndpoint.
GridProblem make_problem(const GridEnvironment& env, const Vec2& start, const Vec2& goal);
GridProblem make_problem_lonlat(const GridEnvironment& env,
                                double start_lon, double start_lat,
                                double goal_lon, double goal_lat);

// Walks came_from back from goal. Empty if the chain breaks before start.
std::vector<CellId> reconstruct_path(const std::vector<CellId>& came_from, CellId start, CellId goal);

// Sum of step costs along path; 0 for a single cell, +inf for an empty path.
double path_cost(const GridProblem& problem, const std::vector<CellId>& path);

} // namespace zonegrid

#include "zonegrid/problem.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "zonegrid/errors.hpp"
#include "zonegrid/projection.hpp"
#include "zonegrid/rasterizer.hpp"

namespace zonegrid {

Vec2 GridProblem::cell_center(CellId id) const {
    auto [col, row] = col_row(id);
    return Vec2{bounds.min_x + (col + 0.5) * cell_size_m,
                bounds.min_y + (row + 0.5) * cell_size_m};
}

double GridProblem::heuristic_euclidean_m(CellId id, std::optional<double> min_multiplier) const {
    auto [ca, ra] = col_row(id);
    auto [cb, rb] = col_row(goal);
    const double base = cell_size_m * std::hypot(cb - ca, rb - ra);
    if (!min_multiplier) return base;
    const double m = *min_multiplier;
    if (!std::isfinite(m) || m <= 0) return base;
    return base * m;
}

double GridProblem::min_cost_multiplier() const {
    double best = std::numeric_limits<double>::infinity();
    for (float m : cost_multiplier) {
        if (m > 0 && std::isfinite(m)) best = std::min(best, static_cast<double>(m));
    }
    return std::isfinite(best) ? best : 1.0;
}

void validate(const GridProblem& p) {
    if (p.width <= 0 || p.height <= 0) {
        throw InvalidProblem("width and height must be positive");
    }
    if (!(p.cell_size_m > 0)) {
        throw InvalidProblem("cell_size_m must be positive");
    }
    const size_t n = p.size();
    if (p.blocked.size() != n) {
        throw InvalidProblem("blocked length " + std::to_string(p.blocked.size()) +
                             " != width*height " + std::to_string(n));
    }
    if (p.cost_multiplier.size() != n) {
        throw InvalidProblem("cost_multiplier length " + std::to_string(p.cost_multiplier.size()) +
                             " != width*height " + std::to_string(n));
    }
    if (p.start < 0 || p.goal < 0 ||
        static_cast<size_t>(p.start) >= n || static_cast<size_t>(p.goal) >= n) {
        throw InvalidProblem("start/goal out of bounds");
    }
}

size_t check_cell_cap(const Bounds& bounds, double cell_size_m, size_t cap) {
    if (cell_size_m > 0 && std::isfinite(cell_size_m) &&
        std::isfinite(bounds.span_x()) && std::isfinite(bounds.span_y())) {
        // Reject in double first; the int dimensions may not be representable.
        const double cells_d = std::max(1.0, std::ceil(bounds.span_x() / cell_size_m)) *
                               std::max(1.0, std::ceil(bounds.span_y() / cell_size_m));
        if (!(cells_d <= static_cast<double>(cap))) {
            const size_t cells = cells_d >= static_cast<double>(std::numeric_limits<size_t>::max())
                ? std::numeric_limits<size_t>::max() : static_cast<size_t>(cells_d);
            throw InputTooLarge(cells, cap);
        }
    }
    auto [width, height] = grid_dimensions(bounds, cell_size_m);
    const size_t cells = static_cast<size_t>(width) * height;
    if (cells > cap) throw InputTooLarge(cells, cap);
    return cells;
}

GridProblem make_problem(const GridEnvironment& env, const Vec2& start, const Vec2& goal) {
    auto s = env.world_to_cell(start.x, start.y);
    auto g = env.world_to_cell(goal.x, goal.y);
    if (!s || !g) {
        throw OutOfBounds("Start or goal is outside the planning area rectangle");
    }
    if (env.is_blocked(*s)) throw BlockedEndpoint(Endpoint::Start);
    if (env.is_blocked(*g)) throw BlockedEndpoint(Endpoint::Goal);

    GridProblem p;
    p.width = env.width();
    p.height = env.height();
    p.cell_size_m = env.cell_size_m();
    p.bounds = env.bounds();
    p.start = *s;
    p.goal = *g;
    p.blocked = env.blocked();
    p.cost_multiplier.reserve(env.size());
    for (float m : env.cost_multiplier()) {
        p.cost_multiplier.push_back(std::isfinite(m) ? m : 1.0f);
    }
    return p;
}

GridProblem make_problem_lonlat(const GridEnvironment& env,
                                double start_lon, double start_lat,
                                double goal_lon, double goal_lat) {
    auto [sx, sy] = lonlat_to_mercator(start_lon, start_lat);
    auto [gx, gy] = lonlat_to_mercator(goal_lon, goal_lat);
    return make_problem(env, Vec2{sx, sy}, Vec2{gx, gy});
}

std::vector<CellId> reconstruct_path(const std::vector<CellId>& came_from, CellId start, CellId goal) {
    if (goal < 0 || static_cast<size_t>(goal) >= came_from.size()) return {};
    if (came_from[goal] == -1 && goal != start) return {};

    std::vector<CellId> out;
    CellId cur = goal;
    while (true) {
        out.push_back(cur);
        if (cur == start) break;
        cur = came_from[cur];
        if (cur < 0 || static_cast<size_t>(cur) >= came_from.size() ||
            out.size() > came_from.size()) {
            return {};
        }
    }
    std::reverse(out.begin(), out.end());
    return out;
}

double path_cost(const GridProblem& problem, const std::vector<CellId>& path) {
    if (path.empty()) return std::numeric_limits<double>::infinity();
    double total = 0.0;
    for (size_t i = 1; i < path.size(); i++) {
        auto [ac, ar] = problem.col_row(path[i - 1]);
        auto [bc, br] = problem.col_row(path[i]);
        const double step = problem.cell_size_m * std::hypot(bc - ac, br - ar);
        total += problem.step_cost(path[i], step);
    }
    return total;
}

} // namespace zonegrid

#include "zonegrid/grid_environment.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "zonegrid/errors.hpp"
#include "zonegrid/projection.hpp"

namespace zonegrid {

namespace {
struct Direction {
    int dc;
    int dr;
    double scale;
};

constexpr double SQRT2 = 1.41421356237309504880;

constexpr std::array<Direction, 8> DIRECTIONS = {{
    {1, 0, 1.0},
    {-1, 0, 1.0},
    {0, 1, 1.0},
    {0, -1, 1.0},
    {1, 1, SQRT2},
    {1, -1, SQRT2},
    {-1, 1, SQRT2},
    {-1, -1, SQRT2},
}};
}

NeighborList neighbors8(int width, int height, double cell_size_m,
                        const std::vector<uint8_t>& blocked, CellId id) {
    NeighborList out;
    const int row = id / width;
    const int col = id - row * width;

    for (const auto& d : DIRECTIONS) {
        const int c = col + d.dc;
        const int r = row + d.dr;
        if (c < 0 || r < 0 || c >= width || r >= height) continue;
        const CellId nid = r * width + c;
        if (blocked[nid]) continue;
        out.items[out.count++] = Neighbor{nid, cell_size_m * d.scale};
    }
    return out;
}

GridEnvironment::GridEnvironment(double cell_size_m, const Bounds& bounds, int width, int height,
                                 std::vector<uint8_t> blocked, std::vector<float> cost_multiplier)
    : cell_size_m_(cell_size_m)
    , bounds_(bounds)
    , width_(width)
    , height_(height)
    , blocked_(std::move(blocked))
    , cost_multiplier_(std::move(cost_multiplier)) {
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive");
    }
    if (blocked_.size() != size() || cost_multiplier_.size() != size()) {
        throw std::invalid_argument("Grid arrays must hold width*height = " +
                                    std::to_string(size()) + " cells");
    }
}

void require_cell(CellId id, size_t size) {
    if (id < 0 || static_cast<size_t>(id) >= size) {
        throw OutOfBounds("Cell id " + std::to_string(id) + " outside grid of " +
                          std::to_string(size) + " cells");
    }
}

std::pair<int, int> GridEnvironment::col_row(CellId id) const {
    const int row = id / width_;
    return {id - row * width_, row};
}

std::optional<CellId> GridEnvironment::world_to_cell(double x, double y) const {
    const double fc = std::floor((x - bounds_.min_x) / cell_size_m_);
    const double fr = std::floor((y - bounds_.min_y) / cell_size_m_);
    if (!(fc >= 0 && fr >= 0 && fc < width_ && fr < height_)) return std::nullopt;
    if (x >= bounds_.max_x || y >= bounds_.max_y) return std::nullopt;
    return cell_id(static_cast<int>(fc), static_cast<int>(fr));
}

Vec2 GridEnvironment::cell_center(CellId id) const {
    auto [col, row] = col_row(id);
    return Vec2{bounds_.min_x + (col + 0.5) * cell_size_m_,
                bounds_.min_y + (row + 0.5) * cell_size_m_};
}

std::pair<double, double> GridEnvironment::cell_center_lonlat(CellId id) const {
    Vec2 c = cell_center(id);
    return mercator_to_lonlat(c.x, c.y);
}

size_t GridEnvironment::blocked_count() const {
    return static_cast<size_t>(std::count_if(blocked_.begin(), blocked_.end(),
                                                      [](uint8_t b) { return b != 0; }));
}

NeighborList GridEnvironment::neighbors8(CellId id) const {
    return zonegrid::neighbors8(width_, height_, cell_size_m_, blocked_, id);
}

double GridEnvironment::path_length_m(const std::vector<CellId>& path) const {
    double total = 0.0;
    for (size_t i = 1; i < path.size(); i++) {
        Vec2 a = cell_center(path[i - 1]);
        Vec2 b = cell_center(path[i]);
        total += std::hypot(b.x - a.x, b.y - a.y);
    }
    return total;
}

} // namespace zonegrid

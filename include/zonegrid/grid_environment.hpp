#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "zonegrid/polygon.hpp"

namespace zonegrid {

using CellId = int32_t;

// Throws OutOfBounds unless 0 <= id < size.
void require_cell(CellId id, size_t size);

struct Neighbor {
    CellId id;
    double step_distance_m;
};

// Up to 8 free neighbours, stored inline.
struct NeighborList {
    std::array<Neighbor, 8> items;
    int count = 0;

    const Neighbor* begin() const { return items.data(); }
    const Neighbor* end() const { return items.data() + count; }
    int size() const { return count; }
    bool empty() const { return count == 0; }
};

// Multiplier used for stepping into a cell; unset or non-finite values count as 1.
inline double effective_multiplier(double m) {
    return (m > 0 && m <= std::numeric_limits<double>::max()) ? m : 1.0;
}

// Shared by GridEnvironment and GridProblem. Order: E, W, N, S, NE, SE, NW, SW.
NeighborList neighbors8(int width, int height, double cell_size_m,
                        const std::vector<uint8_t>& blocked, CellId id);

// Immutable rasterized grid. Row-major ids, rows increase with northing.
class GridEnvironment {
public:
    GridEnvironment(double cell_size_m, const Bounds& bounds, int width, int height,
                    std::vector<uint8_t> blocked, std::vector<float> cost_multiplier);

    int width() const { return width_; }
    int height() const { return height_; }
    double cell_size_m() const { return cell_size_m_; }
    const Bounds& bounds() const { return bounds_; }
    size_t size() const { return static_cast<size_t>(width_) * height_; }

    const std::vector<uint8_t>& blocked() const { return blocked_; }
    const std::vector<float>& cost_multiplier() const { return cost_multiplier_; }

    CellId cell_id(int col, int row) const { return row * width_ + col; }
    std::pair<int, int> col_row(CellId id) const;
    bool in_bounds(int col, int row) const {
        return col >= 0 && row >= 0 && col < width_ && row < height_;
    }

    std::optional<CellId> world_to_cell(double x, double y) const;
    Vec2 cell_center(CellId id) const;
    std::pair<double, double> cell_center_lonlat(CellId id) const;

    bool is_blocked(CellId id) const { return blocked_[id] != 0; }
    double cost_multiplier_at(CellId id) const { return effective_multiplier(cost_multiplier_[id]); }
    size_t blocked_count() const;

    NeighborList neighbors8(CellId id) const;

    // Cost is charged on arrival: distance times the destination multiplier.
    double step_cost(CellId to, double step_distance_m) const {
        return step_distance_m * cost_multiplier_at(to);
    }

    // Sum of straight-line distances between consecutive cell centres.
    double path_length_m(const std::vector<CellId>& path) const;

private:
    double cell_size_m_;
    Bounds bounds_;
    int width_;
    int height_;
    std::vector<uint8_t> blocked_;
    std::vector<float> cost_multiplier_;
};

} // namespace zonegrid

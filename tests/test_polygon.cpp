#include <gtest/gtest.h>
#include "zonegrid/polygon.hpp"
#include <cmath>

namespace {
zonegrid::Ring square(double x0, double y0, double x1, double y1) {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}
}

class PolygonTest : public ::testing::Test {
protected:
    // 10x10 square with a 4x4 hole in the middle
    zonegrid::Polygon donut = {
        square(0, 0, 10, 10),
        square(3, 3, 7, 7),
    };
};

TEST_F(PolygonTest, BboxCoversAllRings) {
    zonegrid::MultiPolygon polys = {donut, {square(20, -5, 25, 2)}};
    auto b = zonegrid::bbox(polys);

    EXPECT_DOUBLE_EQ(b.min_x, 0.0);
    EXPECT_DOUBLE_EQ(b.min_y, -5.0);
    EXPECT_DOUBLE_EQ(b.max_x, 25.0);
    EXPECT_DOUBLE_EQ(b.max_y, 10.0);
}

TEST_F(PolygonTest, EmptyBbox) {
    EXPECT_TRUE(zonegrid::bbox(zonegrid::MultiPolygon{}).empty());
    EXPECT_TRUE(zonegrid::bbox(zonegrid::Polygon{zonegrid::Ring{}}).empty());
}

TEST_F(PolygonTest, BboxIntersects) {
    zonegrid::Bounds a{0, 0, 10, 10};
    EXPECT_TRUE(a.intersects(zonegrid::Bounds{5, 5, 15, 15}));
    EXPECT_FALSE(a.intersects(zonegrid::Bounds{11, 0, 15, 10}));
    EXPECT_FALSE(a.intersects(zonegrid::Bounds{}));
    EXPECT_TRUE(a.intersects(zonegrid::Bounds{11, 0, 15, 10}.expanded(2)));
}

TEST_F(PolygonTest, PointInRingOpenAndClosed) {
    auto open = square(0, 0, 10, 10);
    auto closed = open;
    closed.push_back(closed.front());

    EXPECT_TRUE(zonegrid::point_in_ring(5, 5, open));
    EXPECT_TRUE(zonegrid::point_in_ring(5, 5, closed));
    EXPECT_FALSE(zonegrid::point_in_ring(15, 5, open));
    EXPECT_FALSE(zonegrid::point_in_ring(15, 5, closed));
}

TEST_F(PolygonTest, PointInConcaveRing) {
    // L shape
    zonegrid::Ring l = {{0, 0}, {10, 0}, {10, 4}, {4, 4}, {4, 10}, {0, 10}};
    EXPECT_TRUE(zonegrid::point_in_ring(2, 8, l));
    EXPECT_TRUE(zonegrid::point_in_ring(8, 2, l));
    EXPECT_FALSE(zonegrid::point_in_ring(8, 8, l));
}

TEST_F(PolygonTest, HolesAreOutside) {
    EXPECT_TRUE(zonegrid::point_in_polygon(1, 1, donut));
    EXPECT_FALSE(zonegrid::point_in_polygon(5, 5, donut));
    EXPECT_FALSE(zonegrid::point_in_polygon(11, 5, donut));
}

TEST_F(PolygonTest, DegenerateGeometryIsOutside) {
    EXPECT_FALSE(zonegrid::point_in_polygon(0, 0, zonegrid::Polygon{}));
    EXPECT_FALSE(zonegrid::point_in_ring(0, 0, zonegrid::Ring{}));
    EXPECT_FALSE(zonegrid::point_in_ring(0, 0, zonegrid::Ring{{0, 0}}));
    EXPECT_FALSE(zonegrid::point_in_any(0, 0, zonegrid::MultiPolygon{}));
}

TEST_F(PolygonTest, PointInAnyMember) {
    zonegrid::MultiPolygon polys = {donut, {square(20, 0, 30, 10)}};
    EXPECT_TRUE(zonegrid::point_in_any(25, 5, polys));
    EXPECT_TRUE(zonegrid::point_in_any(1, 1, polys));
    EXPECT_FALSE(zonegrid::point_in_any(15, 5, polys));
}

TEST_F(PolygonTest, SegmentDistanceIsClamped) {
    // Perpendicular foot inside the segment
    EXPECT_NEAR(zonegrid::point_segment_distance(5, 3, 0, 0, 10, 0), 3.0, 1e-12);
    // Beyond the end: distance to the endpoint, not the line
    EXPECT_NEAR(zonegrid::point_segment_distance(13, 4, 0, 0, 10, 0), 5.0, 1e-12);
    // Zero-length segment
    EXPECT_NEAR(zonegrid::point_segment_distance(3, 4, 0, 0, 0, 0), 5.0, 1e-12);
}

TEST_F(PolygonTest, DistanceIncludesClosingEdgeAndHoles) {
    zonegrid::MultiPolygon polys = {donut};
    // Closing edge (0,10)->(0,0)
    EXPECT_NEAR(zonegrid::distance_to_polygons(-2, 5, polys), 2.0, 1e-12);
    // Nearest edge is on the hole
    EXPECT_NEAR(zonegrid::distance_to_polygons(5, 5, polys), 2.0, 1e-12);
    EXPECT_NEAR(zonegrid::distance_to_polygons(13, 14, polys), 5.0, 1e-12);
}

TEST_F(PolygonTest, DistanceWithoutEdgesIsInfinite) {
    EXPECT_TRUE(std::isinf(zonegrid::distance_to_polygons(0, 0, zonegrid::MultiPolygon{})));
    zonegrid::MultiPolygon single = {{zonegrid::Ring{{1, 1}}}};
    EXPECT_TRUE(std::isinf(zonegrid::distance_to_polygons(0, 0, single)));
}

#include <gtest/gtest.h>
#include "zonegrid/buffer.hpp"
#include "zonegrid/projection.hpp"
#include "zonegrid/zone.hpp"

namespace {
zonegrid::Ring square(double x0, double y0, double x1, double y1) {
    return {{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}
}

class BufferTest : public ::testing::Test {
protected:
    zonegrid::MultiPolygon box = {{square(0, 0, 10, 10)}};
};

TEST_F(BufferTest, ZeroMarginIsIdentity) {
    auto out = zonegrid::buffer_polygons(box, 0.0);
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].size(), 1u);
    EXPECT_EQ(out[0][0].size(), 4u);
}

TEST_F(BufferTest, ExpandsOutward) {
    auto out = zonegrid::buffer_polygons(box, 2.0);

    EXPECT_TRUE(zonegrid::point_in_any(11.0, 5.0, out));
    EXPECT_TRUE(zonegrid::point_in_any(5.0, -1.5, out));
    EXPECT_FALSE(zonegrid::point_in_any(13.0, 5.0, out));
    // Round corner: the diagonal point is 2.12 m away
    EXPECT_FALSE(zonegrid::point_in_any(11.5, 11.5, out));
}

TEST_F(BufferTest, OriginalInteriorStaysInside) {
    auto out = zonegrid::buffer_polygons(box, 5.0);
    for (double x = 0.5; x < 10; x += 1.0) {
        for (double y = 0.5; y < 10; y += 1.0) {
            EXPECT_TRUE(zonegrid::point_in_any(x, y, out));
        }
    }
}

TEST_F(BufferTest, GroundScaleWidensMargin) {
    auto out = zonegrid::buffer_polygons(box, 2.0, 2.0);
    EXPECT_TRUE(zonegrid::point_in_any(13.0, 5.0, out));
    EXPECT_FALSE(zonegrid::point_in_any(14.5, 5.0, out));
}

TEST_F(BufferTest, HolesShrink) {
    zonegrid::MultiPolygon donut = {{square(0, 0, 20, 20), square(5, 5, 15, 15)}};
    auto out = zonegrid::buffer_polygons(donut, 1.0);

    EXPECT_FALSE(zonegrid::point_in_any(10.0, 10.0, out));
    EXPECT_TRUE(zonegrid::point_in_any(5.5, 10.0, out));
}

TEST_F(BufferTest, DegenerateShapesPassThrough) {
    zonegrid::MultiPolygon degenerate = {{zonegrid::Ring{{0, 0}, {1, 1}}}};
    auto out = zonegrid::buffer_polygons(degenerate, 10.0);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0][0].size(), 2u);
}

TEST_F(BufferTest, NoFlyZoneBuffersInGroundMetres) {
    // At 60 degrees north one ground metre spans two projected metres
    auto [cx, cy] = zonegrid::lonlat_to_mercator(10.0, 60.0);
    zonegrid::MultiPolygon shape = {{square(cx, cy, cx + 100, cy + 100)}};

    auto zone = zonegrid::make_no_fly_zone("nf", "No-fly 1", shape, 10.0);

    EXPECT_EQ(zone.kind, zonegrid::ZoneKind::NoFly);
    EXPECT_EQ(&zone.raster_shape(), &zone.buffered);
    EXPECT_TRUE(zonegrid::point_in_any(cx + 115, cy + 50, zone.buffered));
    EXPECT_FALSE(zonegrid::point_in_any(cx + 125, cy + 50, zone.buffered));
    EXPECT_FALSE(zonegrid::point_in_any(cx + 115, cy + 50, zone.shape));
}

TEST_F(BufferTest, CostZoneKeepsOriginalShape) {
    auto zone = zonegrid::make_cost_zone("c1", "Cost zone 1", "slow", box);
    EXPECT_EQ(zone.kind, zonegrid::ZoneKind::Cost);
    EXPECT_EQ(&zone.raster_shape(), &zone.shape);
    EXPECT_TRUE(zone.buffered.empty());
}

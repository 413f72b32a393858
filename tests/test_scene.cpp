#include <gtest/gtest.h>
#include "zonegrid/errors.hpp"
#include "zonegrid/scene.hpp"
#include <cstdio>
#include <fstream>

using json = nlohmann::json;

class SceneTest : public ::testing::Test {
protected:
    std::string test_path = "/tmp/test_zonegrid_scene.json";

    json scene_json = json::parse(R"({
        "version": 1,
        "planning_bounds": {"south": 37.420, "west": -122.180, "north": 37.425, "east": -122.175},
        "resolution_m": 10,
        "no_fly_buffer_m": 10,
        "cost_zone_types": [
            {"id": "slow", "name": "Slow", "multiplier": 3, "color": "#ff8800"}
        ],
        "zones": [
            {"id": "nf1", "name": "Stadium", "type": "NO_FLY",
             "shape": {"type": "Feature", "properties": {}, "geometry": {"type": "Polygon",
                       "coordinates": [[[-122.178, 37.421], [-122.177, 37.421],
                                        [-122.177, 37.422], [-122.178, 37.422],
                                        [-122.178, 37.421]]]}}},
            {"id": "c1", "name": "Quad", "type": "COST", "cost_type_id": "slow",
             "shape": {"type": "Polygon",
                       "coordinates": [[[-122.1765, 37.4230], [-122.1755, 37.4230],
                                        [-122.1755, 37.4240], [-122.1765, 37.4240]]]}},
            {"id": "c2", "name": "Saved", "type": "COST", "multiplier": 80,
             "shape": {"type": "MultiPolygon",
                       "coordinates": [[[[-122.1795, 37.4240], [-122.1790, 37.4240],
                                         [-122.1790, 37.4245], [-122.1795, 37.4245]]]]}}
        ],
        "start": {"lat": 37.4205, "lng": -122.1795},
        "goal": {"lat": 37.4245, "lng": -122.1755}
    })");

    void SetUp() override {
        std::ofstream out(test_path);
        out << scene_json.dump(2);
    }

    void TearDown() override {
        std::remove(test_path.c_str());
    }
};

TEST_F(SceneTest, ParsesSettingsAndZones) {
    auto scene = zonegrid::parse_scene(scene_json);

    EXPECT_DOUBLE_EQ(scene.resolution_m, 10.0);
    EXPECT_DOUBLE_EQ(scene.no_fly_buffer_m, 10.0);
    EXPECT_EQ(scene.max_cells, zonegrid::DEFAULT_MAX_CELLS);
    EXPECT_FALSE(scene.avoid_high_multiplier);
    ASSERT_EQ(scene.zones.size(), 3u);
    EXPECT_EQ(scene.zones[0].kind, zonegrid::ZoneKind::NoFly);
    EXPECT_EQ(scene.zones[0].name, "Stadium");
    EXPECT_EQ(scene.zones[1].cost_type_id, "slow");
    ASSERT_TRUE(scene.start.has_value());
    EXPECT_DOUBLE_EQ(scene.goal->lng, -122.1755);
}

TEST_F(SceneTest, InlineMultiplierIsClamped) {
    auto scene = zonegrid::parse_scene(scene_json);

    ASSERT_EQ(scene.cost_zone_types.size(), 2u);
    const auto& inline_type = scene.cost_zone_types[1];
    EXPECT_EQ(inline_type.id, "c2:inline");
    EXPECT_DOUBLE_EQ(inline_type.multiplier, zonegrid::MAX_ZONE_MULTIPLIER);
    EXPECT_EQ(scene.zones[2].cost_type_id, "c2:inline");
}

TEST_F(SceneTest, NoFlyZoneIsBuffered) {
    auto scene = zonegrid::parse_scene(scene_json);
    const auto& nf = scene.zones[0];

    auto ob = zonegrid::bbox(nf.shape);
    auto bb = zonegrid::bbox(nf.buffered);
    EXPECT_LT(bb.min_x, ob.min_x - 10.0);
    EXPECT_GT(bb.max_y, ob.max_y + 10.0);
}

TEST_F(SceneTest, BuildEnvironment) {
    auto scene = zonegrid::load_scene(test_path);
    auto env = zonegrid::build_environment(scene);

    auto params = zonegrid::raster_params(scene);
    auto [w, h] = zonegrid::grid_dimensions(params.bounds, 10.0);
    EXPECT_EQ(env.width(), w);
    EXPECT_EQ(env.height(), h);
    EXPECT_GT(env.blocked_count(), 0u);

    auto [sx, sy] = zonegrid::lonlat_to_mercator(-122.1775, 37.4215);
    auto inside = env.world_to_cell(sx, sy);
    ASSERT_TRUE(inside.has_value());
    EXPECT_TRUE(env.is_blocked(*inside));

    auto [cx, cy] = zonegrid::lonlat_to_mercator(-122.1760, 37.4235);
    auto costly = env.world_to_cell(cx, cy);
    ASSERT_TRUE(costly.has_value());
    EXPECT_DOUBLE_EQ(env.cost_multiplier_at(*costly), 3.0);

    auto problem = zonegrid::make_problem_lonlat(env, scene.start->lng, scene.start->lat,
                                                 scene.goal->lng, scene.goal->lat);
    EXPECT_FALSE(problem.is_blocked(problem.start));
}

TEST_F(SceneTest, CellCapEnforced) {
    scene_json["max_cells"] = 100;
    auto scene = zonegrid::parse_scene(scene_json);
    EXPECT_THROW(zonegrid::build_environment(scene), zonegrid::InputTooLarge);
}

TEST_F(SceneTest, TinyResolutionHitsCellCap) {
    scene_json["resolution_m"] = 1e-6;
    auto scene = zonegrid::parse_scene(scene_json);
    EXPECT_THROW(zonegrid::build_environment(scene), zonegrid::InputTooLarge);
}

TEST_F(SceneTest, MaxCellsMustBePositive) {
    auto bad = scene_json;
    bad["max_cells"] = -1;
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);
    bad["max_cells"] = 0;
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);
    bad["max_cells"] = 12.5;
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);
    bad["max_cells"] = 500000;
    EXPECT_EQ(zonegrid::parse_scene(bad).max_cells, 500000u);
}

TEST_F(SceneTest, RolloffSettings) {
    scene_json["avoid_high_multiplier"] = true;
    scene_json["rolloff_distance_m"] = 25;
    auto params = zonegrid::raster_params(zonegrid::parse_scene(scene_json));
    EXPECT_TRUE(params.avoid_high_multiplier);
    EXPECT_DOUBLE_EQ(params.rolloff_distance_m, 25.0);
    EXPECT_DOUBLE_EQ(params.cell_size_m, 10.0);
}

TEST_F(SceneTest, MalformedScenes) {
    auto bad = scene_json;
    bad["zones"][0]["type"] = "MAYBE";
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);

    bad = scene_json;
    bad["zones"][1]["shape"] = json{{"type", "LineString"}, {"coordinates", json::array()}};
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);

    bad = scene_json;
    bad["zones"][1].erase("cost_type_id");
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);

    bad = scene_json;
    bad["resolution_m"] = 0;
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);

    bad = scene_json;
    bad["planning_bounds"]["north"] = 90.0;
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);

    bad = scene_json;
    bad.erase("planning_bounds");
    EXPECT_THROW(zonegrid::parse_scene(bad), zonegrid::SceneError);

    EXPECT_THROW(zonegrid::load_scene("/tmp/does_not_exist_zonegrid.json"), zonegrid::SceneError);
}

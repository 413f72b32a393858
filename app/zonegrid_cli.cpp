#include <fstream>
#include <iostream>
#include <string>

#include "zonegrid/zonegrid.hpp"

namespace {
void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <scene.json> [out.json] [--algorithm ID] [--visited] [--verbose]\n"
              << "Rasterizes the scene and writes the algorithm run request as JSON.\n";
}
}

int main(int argc, char** argv) {
    std::string scene_path;
    std::string out_path;
    std::string algorithm_id = "astar";
    bool visited = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--algorithm" && i + 1 < argc) {
            algorithm_id = argv[++i];
        } else if (arg == "--visited") {
            visited = true;
        } else if (arg == "--verbose") {
            zonegrid::log::set_level(spdlog::level::debug);
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (scene_path.empty()) {
            scene_path = arg;
        } else if (out_path.empty()) {
            out_path = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (scene_path.empty()) {
        usage(argv[0]);
        return 1;
    }

    try {
        zonegrid::Scene scene = zonegrid::load_scene(scene_path);
        zonegrid::GridEnvironment env = zonegrid::build_environment(scene);

        auto logger = zonegrid::log::get();
        logger->info("Grid {}x{} at {} m, {} blocked cells",
                     env.width(), env.height(), env.cell_size_m(), env.blocked_count());

        if (!scene.start || !scene.goal) {
            throw zonegrid::SceneError("Scene needs both start and goal to build a run request");
        }

        zonegrid::RunRequest request;
        request.algorithm_id = algorithm_id;
        request.problem = zonegrid::make_problem_lonlat(env, scene.start->lng, scene.start->lat,
                                                        scene.goal->lng, scene.goal->lat);
        zonegrid::RunOptions options;
        options.return_visited = visited;
        request.options = options;

        const std::string text = nlohmann::json(request).dump();
        if (out_path.empty()) {
            std::cout << text << "\n";
        } else {
            std::ofstream out(out_path);
            if (!out) throw std::runtime_error("Cannot open " + out_path + " for writing");
            out << text << "\n";
            logger->info("Run request written to {}", out_path);
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}

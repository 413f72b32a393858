#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "zonegrid/zonegrid.hpp"

namespace py = pybind11;

namespace {
using PyRing = std::vector<std::pair<double, double>>;
using PyPolygon = std::vector<PyRing>;

zonegrid::MultiPolygon to_multi_polygon(const std::vector<PyPolygon>& polys) {
    zonegrid::MultiPolygon out;
    for (const auto& poly : polys) {
        zonegrid::Polygon p;
        for (const auto& ring : poly) {
            zonegrid::Ring r;
            for (const auto& [x, y] : ring) r.push_back({x, y});
            p.push_back(std::move(r));
        }
        out.push_back(std::move(p));
    }
    return out;
}

template<typename T>
py::array array_view(const std::vector<T>& data, py::handle owner) {
    return py::array_t<T>({static_cast<py::ssize_t>(data.size())}, {static_cast<py::ssize_t>(sizeof(T))}, data.data(), owner);
}
}

PYBIND11_MODULE(_zonegrid_cpp, m) {
    m.doc() = "zonegrid C++ backend: zone rasterization and grid environments for path planning";
    m.attr("__version__") = zonegrid::VERSION;

    py::register_exception<zonegrid::InputTooLarge>(m, "InputTooLarge", PyExc_ValueError);
    py::register_exception<zonegrid::OutOfBounds>(m, "OutOfBounds", PyExc_IndexError);
    py::register_exception<zonegrid::BlockedEndpoint>(m, "BlockedEndpoint", PyExc_ValueError);
    py::register_exception<zonegrid::InvalidProblem>(m, "InvalidProblem", PyExc_ValueError);

    py::class_<zonegrid::Bounds>(m, "Bounds")
        .def(py::init([](double min_x, double min_y, double max_x, double max_y) {
            return zonegrid::Bounds{min_x, min_y, max_x, max_y};
        }), py::arg("min_x"), py::arg("min_y"), py::arg("max_x"), py::arg("max_y"))
        .def_readwrite("min_x", &zonegrid::Bounds::min_x)
        .def_readwrite("min_y", &zonegrid::Bounds::min_y)
        .def_readwrite("max_x", &zonegrid::Bounds::max_x)
        .def_readwrite("max_y", &zonegrid::Bounds::max_y);

    m.def("lonlat_to_mercator", &zonegrid::lonlat_to_mercator, py::arg("lon"), py::arg("lat"));
    m.def("mercator_to_lonlat", &zonegrid::mercator_to_lonlat, py::arg("x"), py::arg("y"));
    m.def("planning_bounds", [](double south, double west, double north, double east) {
        return zonegrid::to_planning_bounds(zonegrid::GeoRect{south, west, north, east});
    }, py::arg("south"), py::arg("west"), py::arg("north"), py::arg("east"));
    m.def("check_cell_cap", &zonegrid::check_cell_cap,
          py::arg("bounds"), py::arg("cell_size_m"), py::arg("cap") = zonegrid::DEFAULT_MAX_CELLS);

    py::class_<zonegrid::CostZoneType>(m, "CostZoneType")
        .def(py::init([](std::string id, std::string name, double multiplier, std::string color) {
            return zonegrid::CostZoneType{std::move(id), std::move(name), multiplier, std::move(color)};
        }), py::arg("id"), py::arg("name"), py::arg("multiplier"), py::arg("color") = "")
        .def_readonly("id", &zonegrid::CostZoneType::id)
        .def_readonly("name", &zonegrid::CostZoneType::name)
        .def_readonly("multiplier", &zonegrid::CostZoneType::multiplier);

    py::class_<zonegrid::Zone>(m, "Zone")
        .def_readonly("id", &zonegrid::Zone::id)
        .def_readonly("name", &zonegrid::Zone::name)
        .def_property_readonly("kind", [](const zonegrid::Zone& z) {
            return std::string(zonegrid::to_string(z.kind));
        });

    m.def("no_fly_zone", [](std::string id, std::string name, const std::vector<PyPolygon>& shape,
                            double buffer_m) {
        return zonegrid::make_no_fly_zone(std::move(id), std::move(name), to_multi_polygon(shape), buffer_m);
    }, py::arg("id"), py::arg("name"), py::arg("shape"),
       py::arg("buffer_m") = zonegrid::DEFAULT_NO_FLY_BUFFER_M);
    m.def("cost_zone", [](std::string id, std::string name, std::string cost_type_id,
                          const std::vector<PyPolygon>& shape) {
        return zonegrid::make_cost_zone(std::move(id), std::move(name), std::move(cost_type_id),
                                        to_multi_polygon(shape));
    }, py::arg("id"), py::arg("name"), py::arg("cost_type_id"), py::arg("shape"));

    py::class_<zonegrid::GridEnvironment>(m, "GridEnvironment")
        .def_property_readonly("width", &zonegrid::GridEnvironment::width)
        .def_property_readonly("height", &zonegrid::GridEnvironment::height)
        .def_property_readonly("cell_size_m", &zonegrid::GridEnvironment::cell_size_m)
        .def_property_readonly("bounds", &zonegrid::GridEnvironment::bounds)
        .def_property_readonly("blocked", [](py::object self) {
            const auto& env = self.cast<const zonegrid::GridEnvironment&>();
            return array_view(env.blocked(), self);
        })
        .def_property_readonly("cost_multiplier", [](py::object self) {
            const auto& env = self.cast<const zonegrid::GridEnvironment&>();
            return array_view(env.cost_multiplier(), self);
        })
        .def("size", &zonegrid::GridEnvironment::size)
        .def("cell_id", [](const zonegrid::GridEnvironment& env, int col, int row) {
            if (!env.in_bounds(col, row)) throw zonegrid::OutOfBounds("Column/row outside grid");
            return env.cell_id(col, row);
        }, py::arg("col"), py::arg("row"))
        .def("col_row", [](const zonegrid::GridEnvironment& env, zonegrid::CellId id) {
            zonegrid::require_cell(id, env.size());
            return env.col_row(id);
        })
        .def("world_to_cell", &zonegrid::GridEnvironment::world_to_cell)
        .def("cell_center", [](const zonegrid::GridEnvironment& env, zonegrid::CellId id) {
            zonegrid::require_cell(id, env.size());
            auto c = env.cell_center(id);
            return std::make_pair(c.x, c.y);
        })
        .def("cell_center_lonlat", [](const zonegrid::GridEnvironment& env, zonegrid::CellId id) {
            zonegrid::require_cell(id, env.size());
            return env.cell_center_lonlat(id);
        })
        .def("is_blocked", [](const zonegrid::GridEnvironment& env, zonegrid::CellId id) {
            zonegrid::require_cell(id, env.size());
            return env.is_blocked(id);
        })
        .def("cost_multiplier_at", [](const zonegrid::GridEnvironment& env, zonegrid::CellId id) {
            zonegrid::require_cell(id, env.size());
            return env.cost_multiplier_at(id);
        })
        .def("blocked_count", &zonegrid::GridEnvironment::blocked_count)
        .def("neighbors8", [](const zonegrid::GridEnvironment& env, zonegrid::CellId id) {
            zonegrid::require_cell(id, env.size());
            std::vector<std::pair<zonegrid::CellId, double>> out;
            for (const auto& n : env.neighbors8(id)) out.emplace_back(n.id, n.step_distance_m);
            return out;
        })
        .def("step_cost", [](const zonegrid::GridEnvironment& env, zonegrid::CellId to, double step_distance_m) {
            zonegrid::require_cell(to, env.size());
            return env.step_cost(to, step_distance_m);
        }, py::arg("to"), py::arg("step_distance_m"))
        .def("path_length_m", [](const zonegrid::GridEnvironment& env, const std::vector<zonegrid::CellId>& path) {
            for (auto id : path) zonegrid::require_cell(id, env.size());
            return env.path_length_m(path);
        });

    m.def("rasterize", [](const std::vector<zonegrid::Zone>& zones,
                          const std::vector<zonegrid::CostZoneType>& cost_types,
                          const zonegrid::Bounds& bounds, double cell_size_m,
                          bool avoid_high_multiplier, double rolloff_distance_m) {
        zonegrid::RasterizeParams params{cell_size_m, bounds, avoid_high_multiplier, rolloff_distance_m};
        py::gil_scoped_release release;
        return zonegrid::rasterize_zones(zones, cost_types, params);
    }, py::arg("zones"), py::arg("cost_types"), py::arg("bounds"), py::arg("cell_size_m"),
       py::arg("avoid_high_multiplier") = false, py::arg("rolloff_distance_m") = 0.0);

    py::class_<zonegrid::RunOptions>(m, "RunOptions")
        .def(py::init<>())
        .def_readwrite("return_visited", &zonegrid::RunOptions::return_visited)
        .def_readwrite("max_visited", &zonegrid::RunOptions::max_visited)
        .def_readwrite("wind_enabled", &zonegrid::RunOptions::wind_enabled)
        .def_readwrite("wind_direction_deg", &zonegrid::RunOptions::wind_direction_deg)
        .def_readwrite("wind_speed_ms", &zonegrid::RunOptions::wind_speed_ms)
        .def_readwrite("drone_airspeed_ms", &zonegrid::RunOptions::drone_airspeed_ms);

    py::class_<zonegrid::GridProblem>(m, "GridProblem")
        .def_readonly("width", &zonegrid::GridProblem::width)
        .def_readonly("height", &zonegrid::GridProblem::height)
        .def_readonly("cell_size_m", &zonegrid::GridProblem::cell_size_m)
        .def_readonly("bounds", &zonegrid::GridProblem::bounds)
        .def_readonly("start", &zonegrid::GridProblem::start)
        .def_readonly("goal", &zonegrid::GridProblem::goal)
        .def("size", &zonegrid::GridProblem::size)
        .def("is_blocked", [](const zonegrid::GridProblem& p, zonegrid::CellId id) {
            zonegrid::require_cell(id, p.size());
            return p.is_blocked(id);
        })
        .def("step_cost", [](const zonegrid::GridProblem& p, zonegrid::CellId to, double step_distance_m) {
            zonegrid::require_cell(to, p.size());
            return p.step_cost(to, step_distance_m);
        }, py::arg("to"), py::arg("step_distance_m"))
        .def("neighbors8", [](const zonegrid::GridProblem& p, zonegrid::CellId id) {
            zonegrid::require_cell(id, p.size());
            std::vector<std::pair<zonegrid::CellId, double>> out;
            for (const auto& n : p.neighbors8(id)) out.emplace_back(n.id, n.step_distance_m);
            return out;
        })
        .def("heuristic_euclidean_m", [](const zonegrid::GridProblem& p, zonegrid::CellId id,
                                         std::optional<double> min_multiplier) {
            zonegrid::require_cell(id, p.size());
            return p.heuristic_euclidean_m(id, min_multiplier);
        }, py::arg("cell_id"), py::arg("min_multiplier") = py::none())
        .def("min_cost_multiplier", &zonegrid::GridProblem::min_cost_multiplier)
        .def("to_json", [](const zonegrid::GridProblem& p) {
            return nlohmann::json(p).dump();
        });

    m.def("make_problem", [](const zonegrid::GridEnvironment& env,
                             std::pair<double, double> start, std::pair<double, double> goal) {
        return zonegrid::make_problem(env, {start.first, start.second}, {goal.first, goal.second});
    }, py::arg("env"), py::arg("start_xy"), py::arg("goal_xy"));
    m.def("path_cost", [](const zonegrid::GridProblem& p, const std::vector<zonegrid::CellId>& path) {
        for (auto id : path) zonegrid::require_cell(id, p.size());
        return zonegrid::path_cost(p, path);
    }, py::arg("problem"), py::arg("path"));
}

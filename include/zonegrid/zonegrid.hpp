#pragma once

#include "zonegrid/algorithm_registry.hpp"
#include "zonegrid/buffer.hpp"
#include "zonegrid/errors.hpp"
#include "zonegrid/grid_environment.hpp"
#include "zonegrid/log.hpp"
#include "zonegrid/polygon.hpp"
#include "zonegrid/problem.hpp"
#include "zonegrid/projection.hpp"
#include "zonegrid/rasterizer.hpp"
#include "zonegrid/scene.hpp"
#include "zonegrid/wire.hpp"
#include "zonegrid/zone.hpp"

namespace zonegrid {

constexpr const char* VERSION = "0.2.0";

} // namespace zonegrid

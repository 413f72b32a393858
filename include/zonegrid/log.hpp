#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace zonegrid::log {

// Shared "zonegrid" logger writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> get();

void set_level(spdlog::level::level_enum level);

} // namespace zonegrid::log

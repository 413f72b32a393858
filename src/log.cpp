#include "zonegrid/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace zonegrid::log {

namespace {
std::once_flag g_init;
std::shared_ptr<spdlog::logger> g_logger;
}

std::shared_ptr<spdlog::logger> get() {
    std::call_once(g_init, [] {
        g_logger = spdlog::get("zonegrid");
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt("zonegrid");
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
            g_logger->set_level(spdlog::level::info);
        }
    });
    return g_logger;
}

void set_level(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace zonegrid::log

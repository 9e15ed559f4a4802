#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

spdlog::logger& fractal_log()
{
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto l = spdlog::get("fractal");
        if (!l) l = spdlog::stderr_color_mt("fractal");
        l->set_pattern("[%^%l%$ +%o] %v");
        l->set_level(spdlog::level::info);
        return l;
    }();
    return *logger;
}

void set_log_level(spdlog::level::level_enum level)
{
    fractal_log().set_level(level);
}

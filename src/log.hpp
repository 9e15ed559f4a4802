#pragma once

#include <spdlog/spdlog.h>

// Process-wide "fractal" logger, writing colored lines to stderr. Created on
// first use at info level; set_log_level() adjusts it afterwards.
spdlog::logger& fractal_log();

void set_log_level(spdlog::level::level_enum level);

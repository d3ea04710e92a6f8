#pragma once
#include "pyfind_common.h"

// the shared "pyfind" logger, created on first use with a colored stderr sink
std::shared_ptr<spdlog::logger> logger();
void init_logging(spdlog::level::level_enum level);
spdlog::level::level_enum parse_log_level(const std::string& name, spdlog::level::level_enum fallback);

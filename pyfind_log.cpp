#include "pyfind_log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("pyfind");
        if (existing) return existing;
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto created = std::make_shared<spdlog::logger>("pyfind", sink);
        created->set_pattern("%^%-7l%$ %v");
        created->set_level(spdlog::level::warn);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

void init_logging(spdlog::level::level_enum level) {
    logger()->set_level(level);
    logger()->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum parse_log_level(const std::string& name, spdlog::level::level_enum fallback) {
    if (name.empty()) return fallback;
    auto level = spdlog::level::from_str(name);
    // from_str answers "off" for anything it does not know
    if (level == spdlog::level::off && name != "off") return fallback;
    return level;
}

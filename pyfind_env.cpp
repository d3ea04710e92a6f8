#include "pyfind_env.h"
#include "pyfind_log.h"

Config init_config() {
    Config cfg;
    cfg.env = current_env();
    auto level = cfg.env.find("PYFIND_LOG_LEVEL");
    cfg.log_level = parse_log_level(level != cfg.env.end() ? level->second : "", spdlog::level::warn);
    cfg.host_python = find_host_python(cfg.env);
    return cfg;
}

std::string find_host_python(const Env& env) {
    auto forced = env.find("PYFIND_PYTHON");
    if (forced != env.end() && !forced->second.empty()) return abs_path(forced->second);
    auto path = env.find("PATH");
    if (path == env.end()) return "";
    for (const std::string name : {"python3", "python"}) {
        for (const auto& dir : split(path->second, kPathSep)) {
            if (dir.empty()) continue;
            fs::path candidate = fs::path(dir) / (kIsWindows ? name + ".exe" : name);
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) return abs_path(candidate.string());
        }
    }
    return "";
}

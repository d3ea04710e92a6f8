#include "pyfind_session.h"
#include "pyfind_log.h"

Session::Session(std::string host, Env env) : host_python(std::move(host)), host_env(std::move(env)) {}

const PythonInfo& Session::current() {
    if (!host_info) {
        if (host_python.empty()) throw std::runtime_error("no host interpreter available");
        host_info = from_exe(host_python, host_env, true, false);
    }
    return *host_info;
}

const PythonInfo& Session::current_system() {
    if (!system_info) {
        if (host_python.empty()) throw std::runtime_error("no host interpreter available");
        system_info = from_exe(host_python, host_env, true, true);
    }
    return *system_info;
}

void Session::clear_cache() {
    discovered_exes.clear();
    host_info.reset();
    system_info.reset();
}

std::optional<PythonInfo> Session::from_exe(const std::string& exe, const Env& env, bool raise_on_error,
                                            bool resolve_to_host) {
    PythonInfo proposed;
    try {
        proposed = run_probe(exe, env);
    } catch (const ProbeFailure& e) {
        if (raise_on_error) throw;
        logger()->info("{}", e.what());
        return std::nullopt;
    }
    if (!resolve_to_host) return proposed;
    try {
        return resolve_to_system(std::move(proposed), env);
    } catch (const std::runtime_error& e) {
        if (raise_on_error) throw;
        logger()->info("ignore {} due cannot resolve system due to {}", exe, e.what());
        return std::nullopt;
    }
}

PythonInfo Session::resolve_to_system(PythonInfo target, const Env& env) {
    std::optional<std::string> start_executable = target.executable;
    std::vector<std::pair<std::string, PythonInfo>> prefixes;
    auto seen = [&](const std::string& prefix) {
        return std::any_of(prefixes.begin(), prefixes.end(), [&](const auto& p) { return p.first == prefix; });
    };
    while (!target.system_executable) {
        std::string prefix = target.system_prefix();
        if (seen(prefix)) {
            if (prefixes.size() == 1) {
                logger()->info("{} links back to itself via prefixes", target.str());
                target.system_executable = target.executable;
                break;
            }
            std::vector<std::string> names;
            for (size_t i = 0; i < prefixes.size(); ++i) {
                logger()->error("{}: prefix={}, info={}", i + 1, prefixes[i].first, prefixes[i].second.repr());
                names.push_back(prefixes[i].first);
            }
            logger()->error("{}: prefix={}, info={}", prefixes.size() + 1, prefix, target.repr());
            throw CycleDetected("prefixes are causing a circle " + join(names, "|"));
        }
        prefixes.emplace_back(prefix, target);
        target = discover_exe(target, prefix, false, env);
    }
    if (target.system_executable && target.executable != target.system_executable) {
        auto outcome = from_exe(*target.system_executable, env);
        if (!outcome) throw std::runtime_error("failed to resolve to system executable");
        target = std::move(*outcome);
    }
    target.executable = start_executable;
    return target;
}

#pragma once
#include "pyfind_probe.h"

using ExeCache = std::map<std::pair<std::string, bool>, PythonInfo>;

// Owns the probe caches of one discovery run. Not thread-safe.
class Session {
    std::string host_python;
    Env host_env;
    std::optional<PythonInfo> host_info;
    std::optional<PythonInfo> system_info;
    ExeCache discovered_exes;

    std::optional<PythonInfo> check_exe(const PythonInfo& info, const std::string& folder, const std::string& name,
                                        bool exact, std::vector<PythonInfo>& discovered, const Env& env);
public:
    explicit Session(std::string host, Env env = current_env());

    const std::string& host() const { return host_python; }
    const Env& env() const { return host_env; }

    // the host interpreter as it reports itself
    const PythonInfo& current();
    // the host interpreter resolved to the installation backing it
    const PythonInfo& current_system();

    std::optional<PythonInfo> from_exe(const std::string& exe, const Env& env, bool raise_on_error = true,
                                       bool resolve_to_host = true);
    PythonInfo resolve_to_system(PythonInfo target, const Env& env);
    PythonInfo discover_exe(const PythonInfo& info, const std::string& prefix, bool exact, const Env& env);

    ExeCache& exe_cache() { return discovered_exes; }
    void clear_cache();
};

std::vector<std::string> possible_exe_names(const PythonInfo& info);
std::vector<std::string> possible_folders(const PythonInfo& info, const std::string& inside_folder);

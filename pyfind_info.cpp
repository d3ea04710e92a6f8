#include "pyfind_info.h"

std::string VersionInfo::str(int at) const {
    std::vector<std::string> parts{std::to_string(major), std::to_string(minor), std::to_string(micro), releaselevel,
                                   std::to_string(serial)};
    parts.resize(static_cast<size_t>(std::clamp(at, 0, 5)));
    return join(parts, ".");
}

std::string PythonInfo::system_prefix() const {
    if (real_prefix) return *real_prefix;
    if (base_prefix) return *base_prefix;
    if (prefix) return *prefix;
    throw std::runtime_error("interpreter " + executable.value_or("?") + " reports no prefix");
}

std::string PythonInfo::system_exec_prefix() const {
    if (real_prefix) return *real_prefix;
    if (base_exec_prefix) return *base_exec_prefix;
    if (exec_prefix) return *exec_prefix;
    throw std::runtime_error("interpreter " + executable.value_or("?") + " reports no exec prefix");
}

std::string PythonInfo::sysconfig_path(const std::string& key,
                                       const std::map<std::string, std::optional<std::string>>& overrides,
                                       char sep) const {
    auto it = sysconfig_paths.find(key);
    if (it == sysconfig_paths.end()) throw std::runtime_error("no sysconfig path named " + key);
    const std::string& pattern = it->second;
    std::string result;
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find('{', pos);
        size_t close = open == std::string::npos ? std::string::npos : pattern.find('}', open);
        if (close == std::string::npos) { result += pattern.substr(pos); break; }
        result += pattern.substr(pos, open - pos);
        std::string name = pattern.substr(open + 1, close - open - 1);
        auto o = overrides.find(name);
        if (o != overrides.end()) {
            result += o->second.value_or("");
        } else {
            auto v = sysconfig_vars.find(name);
            if (v == sysconfig_vars.end())
                throw std::runtime_error(fmt::format("sysconfig path {} uses unknown variable {}", key, name));
            result += v->second.value_or("");
        }
        pos = close + 1;
    }
    std::replace(result.begin(), result.end(), '/', sep);
    return result;
}

std::string PythonInfo::install_path(const std::string& key) const {
    auto d = distutils_install.find(key);
    if (d != distutils_install.end()) return d->second;
    const std::optional<std::string> prefixes[] = {prefix, exec_prefix, base_prefix, base_exec_prefix};
    std::map<std::string, std::optional<std::string>> vars;
    for (const auto& [k, v] : sysconfig_vars) {
        bool is_prefix = v && std::any_of(std::begin(prefixes), std::end(prefixes), [&](const auto& p) { return p == v; });
        if (is_prefix) vars[k] = std::string();
    }
    std::string result = sysconfig_path(key, vars);
    const char sep = static_cast<char>(fs::path::preferred_separator);
    size_t start = result.find_first_not_of(sep);
    result.erase(0, start == std::string::npos ? result.size() : start);
    return result;
}

std::string PythonInfo::system_include() const {
    std::map<std::string, std::optional<std::string>> vars;
    std::string sys_prefix = system_prefix();
    for (const auto& [k, v] : sysconfig_vars) {
        if (v && prefix && v->rfind(*prefix, 0) == 0) vars[k] = sys_prefix;
    }
    std::string include = sysconfig_path("include", vars);
    if (!path_exists(include) && prefix) {
        // some distributions do not follow sysconfig, the headers scheme ends in the project name so take its parent
        fs::path fallback = fs::path(*prefix) / fs::path(install_path("headers")).parent_path();
        if (path_exists(fallback.string())) include = fallback.string();
    }
    return include;
}

std::string PythonInfo::spec() const {
    return fmt::format("{}{}-{}", implementation, version_info.str(5), architecture);
}

std::string PythonInfo::str() const {
    std::vector<std::string> parts{"spec=" + spec()};
    if (system_executable && system_executable != executable) parts.push_back("system=" + *system_executable);
    if (original_executable && original_executable != system_executable && original_executable != executable)
        parts.push_back("original=" + *original_executable);
    parts.push_back("exe=" + executable.value_or("None"));
    parts.push_back("platform=" + platform);
    std::string quoted_version;
    for (char c : version) quoted_version += c == '\n' ? std::string("\\n") : std::string(1, c);
    parts.push_back("version='" + quoted_version + "'");
    parts.push_back("encoding_fs_io=" + file_system_encoding + "-" + stdout_encoding.value_or("None"));
    return "PythonInfo(" + join(parts, ", ") + ")";
}

std::string PythonInfo::repr() const {
    return "PythonInfo(" + to_json() + ")";
}

#pragma once
#include "pyfind_utils.h"

// Everything we know about one concrete interpreter, as reported by the interpreter itself.
struct PythonInfo {
    std::string platform;
    std::string implementation;
    VersionInfo version_info;
    int architecture = 64;
    std::optional<std::string> version_nodot;
    std::string version;
    std::string os;

    std::optional<std::string> prefix;
    std::optional<std::string> base_prefix;
    std::optional<std::string> real_prefix;
    std::optional<std::string> base_exec_prefix;
    std::optional<std::string> exec_prefix;

    std::optional<std::string> executable;           // the path we invoked
    std::optional<std::string> original_executable;  // sys.executable as the interpreter sees it
    std::optional<std::string> system_executable;    // base interpreter, when known

    bool has_venv = false;
    std::vector<std::string> path;
    std::string file_system_encoding;
    std::optional<std::string> stdout_encoding;

    std::optional<std::string> sysconfig_scheme;
    std::map<std::string, std::string> sysconfig_paths;
    std::map<std::string, std::string> distutils_install;
    std::map<std::string, std::string> sysconfig;
    std::map<std::string, std::optional<std::string>> sysconfig_vars;
    std::optional<std::string> system_stdlib;
    std::optional<std::string> system_stdlib_platform;
    int64_t max_size = 0;

    std::string version_str() const { return version_info.str(3); }
    std::string version_release_str() const { return version_info.str(2); }
    std::string python_name() const { return "python" + version_info.str(2); }
    bool is_old_virtualenv() const { return real_prefix.has_value(); }
    bool is_venv() const { return base_prefix.has_value(); }
    std::string system_prefix() const;
    std::string system_exec_prefix() const;

    std::string sysconfig_path(const std::string& key,
                               const std::map<std::string, std::optional<std::string>>& overrides = {},
                               char sep = static_cast<char>(fs::path::preferred_separator)) const;
    std::string install_path(const std::string& key) const;
    std::string system_include() const;

    // e.g. CPython3.11.7.final.0-64
    std::string spec() const;
    std::string str() const;
    std::string repr() const;

    std::string to_json() const;
    static PythonInfo from_json(const std::string& payload);
};

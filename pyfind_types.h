#pragma once
#include "pyfind_common.h"

using Env = std::map<std::string, std::string>;

struct Config {
    std::string host_python;
    std::vector<std::string> python_spec;
    std::vector<std::string> try_first_with;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    bool json_output = false;
    bool list_pep514 = false;
    Env env;
};

struct VersionInfo {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string releaselevel = "final";
    int serial = 0;

    bool operator==(const VersionInfo& o) const = default;
    // dotted form of the first `at` components, at == 5 includes releaselevel and serial
    std::string str(int at = 3) const;
};

struct ProcessResult {
    int code = 0;
    std::string out;
    std::string err;
};

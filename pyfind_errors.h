#pragma once
#include "pyfind_common.h"

struct ProbeFailure : std::runtime_error {
    std::string exe;
    int code;
    std::string out;
    std::string err;
    ProbeFailure(const std::string& e, int c, const std::string& o, const std::string& er);
};

struct AbsolutePathMiss : std::runtime_error {
    std::string path;
    explicit AbsolutePathMiss(const std::string& p)
        : std::runtime_error("absolute interpreter path does not exist: " + p), path(p) {}
};

struct DiscoveryExhausted : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CycleDetected : std::runtime_error {
    using std::runtime_error::runtime_error;
};

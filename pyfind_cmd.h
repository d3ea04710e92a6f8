#pragma once
#include "pyfind_utils.h"

// Applies command line flags on top of `cfg`, false (after printing usage) when they make no sense.
bool parse_args(Config& cfg, const std::vector<std::string>& args);
int run_command(Config& cfg, const std::vector<std::string>& args);

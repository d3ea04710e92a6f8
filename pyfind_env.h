#pragma once
#include "pyfind_utils.h"

Config init_config();
// PYFIND_PYTHON when set, else the first python3 or python on PATH, empty when there is none
std::string find_host_python(const Env& env);

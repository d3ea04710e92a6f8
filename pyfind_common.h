#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <variant>
#include <memory>
#include <filesystem>
#include <cstdlib>
#include <cstdint>
#include <functional>
#include <tuple>
#include <cctype>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace fs = std::filesystem;

#ifdef _WIN32
constexpr bool kIsWindows = true;
constexpr char kPathSep = ';';
#else
constexpr bool kIsWindows = false;
constexpr char kPathSep = ':';
#endif

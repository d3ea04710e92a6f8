#pragma once
#include "pyfind_types.h"

std::vector<std::string> split(const std::string& s, char delim);
std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string quote_arg(const std::string& arg);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
std::string abs_path(const std::string& p);
std::string real_path(const std::string& p);
bool path_exists(const std::string& p);
bool fs_is_case_sensitive();
const std::vector<std::string>& path_extensions();
std::string gen_cookie();
ProcessResult run_process(const std::vector<std::string>& args, const Env& env);
Env current_env();

constexpr std::size_t COOKIE_LENGTH = 32;

constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";
constexpr std::string_view CYAN = "\033[36m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view RED = "\033[31m";

#include "pyfind_utils.h"
#include "pyfind_log.h"
#include <random>
#include <cctype>
#ifndef _WIN32
#include <unistd.h>
#endif

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) parts.push_back(item);
    return parts;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) { if (i) out += sep; out += parts[i]; }
    return out;
}

// posix shell quoting, only used to make logged command lines copy-pasteable
std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && std::all_of(arg.begin(), arg.end(), [](unsigned char c) {
            return std::isalnum(c) || std::string_view("@%+=:,./-_").find(c) != std::string_view::npos; }))
        return arg;
    std::string result = "'";
    for (char c : arg) {
        if (c == '\'') result += "'\"'\"'";
        else result += c;
    }
    result += "'";
    return result;
}

std::string abs_path(const std::string& p) {
    std::error_code ec;
    fs::path a = fs::absolute(p, ec);
    if (ec) return p;
    return a.lexically_normal().string();
}

std::string real_path(const std::string& p) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(p, ec);
    return ec ? abs_path(p) : r.string();
}

bool path_exists(const std::string& p) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

bool fs_is_case_sensitive() {
    static const bool sensitive = [] {
        std::error_code ec;
        fs::path tmp = fs::temp_directory_path(ec);
        if (ec) tmp = ".";
        std::string name = "TmP" + gen_cookie().substr(0, 10);
        fs::path probe = tmp / name;
        { std::ofstream touch(probe); }
        bool result = !fs::exists(tmp / to_lower(name), ec);
        fs::remove(probe, ec);
        logger()->debug("filesystem is {}case-sensitive", result ? "" : "not ");
        return result;
    }();
    return sensitive;
}

const std::vector<std::string>& path_extensions() {
    static const std::vector<std::string> exts = [] {
        std::vector<std::string> out{""};
        const char* pathext = std::getenv("PATHEXT");
        if (pathext) {
            for (const auto& e : split(to_lower(pathext), kPathSep))
                if (std::find(out.begin(), out.end(), e) == out.end()) out.push_back(e);
        }
        return out;
    }();
    return exts;
}

std::string gen_cookie() {
    static constexpr std::string_view alphabet =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    static std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
    std::string cookie;
    for (size_t i = 0; i < COOKIE_LENGTH; ++i) cookie += alphabet[pick(rng)];
    return cookie;
}

#ifndef _WIN32
extern char** environ;
#endif

Env current_env() {
    Env env;
#ifdef _WIN32
    char** entries = _environ;
#else
    char** entries = environ;
#endif
    for (char** e = entries; e && *e; ++e) {
        std::string kv = *e;
        size_t eq = kv.find('=', 1);
        if (eq == std::string::npos) continue;
        env[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    return env;
}

#include "pyfind_discover.h"
#ifndef _WIN32
#include <unistd.h>
#endif

namespace {

std::string default_search_path() {
#ifdef _WIN32
    return ".;C:\\bin";
#else
    size_t n = ::confstr(_CS_PATH, nullptr, 0);
    if (n == 0) return "/bin:/usr/bin";
    std::string buf(n, '\0');
    ::confstr(_CS_PATH, buf.data(), n);
    buf.resize(n - 1);
    return buf;
#endif
}

bool is_file(const std::string& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

}  // namespace

std::vector<std::string> get_paths(const Env& env) {
    auto it = env.find("PATH");
    std::string path = it != env.end() ? it->second : default_search_path();
    std::vector<std::string> paths;
    if (path.empty()) return paths;
    for (const auto& entry : split(path, kPathSep)) {
        if (path_exists(entry)) paths.push_back(entry);
    }
    return paths;
}

std::optional<std::string> check_path(const std::string& candidate, const std::string& dir) {
    std::string name = candidate;
    if (kIsWindows && fs::path(name).extension() != ".exe") name += ".exe";
    if (is_file(name)) return name;
    std::string joined = (fs::path(dir) / name).string();
    if (is_file(joined)) return joined;
    return std::nullopt;
}

std::vector<std::pair<std::string, bool>> possible_specs(const PythonSpec& spec) {
    std::vector<std::pair<std::string, bool>> specs;
    // a literal name found on PATH no longer has to agree on the implementation
    if (spec.str_spec) specs.emplace_back(*spec.str_spec, false);
    for (auto& name : spec.generate_names()) specs.push_back(std::move(name));
    return specs;
}

std::string path_dump(size_t pos, const std::string& dir, const Env& env) {
    std::string content = fmt::format("discover PATH[{}]={}", pos, dir);
    auto debug = env.find("PYFIND_DEBUG");
    if (debug == env.end() || debug->second.empty()) return content;
    content += " with =>";
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) continue;
        auto perms = it->status(entry_ec).permissions();
        if (!entry_ec && (perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) == fs::perms::none)
            continue;
        content += " " + it->path().filename().string();
    }
    return content;
}

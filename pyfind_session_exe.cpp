#include "pyfind_session.h"
#include "pyfind_match.h"
#include "pyfind_log.h"

namespace {

void add_unique(std::vector<std::string>& items, const std::string& item) {
    if (std::find(items.begin(), items.end(), item) == items.end()) items.push_back(item);
}

std::vector<std::string> possible_bases(const PythonInfo& info) {
    std::vector<std::string> bases;
    std::string stem = fs::path(info.executable.value_or("")).stem().string();
    while (!stem.empty() && std::isdigit(static_cast<unsigned char>(stem.back()))) stem.pop_back();
    add_unique(bases, stem);
    add_unique(bases, info.implementation);
    // several implementations ship a "python" executable, try it last
    bases.erase(std::remove(bases.begin(), bases.end(), "python"), bases.end());
    bases.push_back("python");

    std::vector<std::string> out;
    for (const auto& base : bases) {
        std::string lower = to_lower(base);
        out.push_back(lower);
        if (fs_is_case_sensitive()) {
            if (base != lower) out.push_back(base);
            std::string upper = to_upper(base);
            if (upper != base) out.push_back(upper);
        }
    }
    return out;
}

}  // namespace

std::vector<std::string> possible_exe_names(const PythonInfo& info) {
    std::vector<std::string> names;
    for (const auto& base : possible_bases(info)) {
        for (int at = 3; at >= 0; --at) {
            std::string version = info.version_info.str(at);
            for (const std::string arch : {"-" + std::to_string(info.architecture), std::string()}) {
                for (const auto& ext : path_extensions()) add_unique(names, base + version + arch + ext);
            }
        }
    }
    return names;
}

std::vector<std::string> possible_folders(const PythonInfo& info, const std::string& inside_folder) {
    std::vector<std::string> executables;
    for (const auto& exe : {info.executable, info.original_executable}) {
        if (!exe) continue;
        add_unique(executables, real_path(*exe));
        add_unique(executables, *exe);
    }
    std::vector<std::string> candidates;
    for (const auto& exe : executables) {
        std::string base = fs::path(exe).parent_path().string();
        // follow the layout of the interpreter we start from
        if (info.prefix && base.rfind(*info.prefix, 0) == 0) add_unique(candidates, inside_folder + base.substr(info.prefix->size()));
    }
    add_unique(candidates, inside_folder);
    std::vector<std::string> existing;
    for (const auto& c : candidates)
        if (path_exists(c)) existing.push_back(c);
    return existing;
}

std::optional<PythonInfo> Session::check_exe(const PythonInfo& info, const std::string& folder, const std::string& name,
                                             bool exact, std::vector<PythonInfo>& discovered, const Env& env) {
    std::string exe_path = (fs::path(folder) / name).string();
    if (!path_exists(exe_path)) return std::nullopt;
    auto found = from_exe(exe_path, env, false, false);
    if (!found) return std::nullopt;
    std::optional<std::pair<std::string, std::string>> diff;
    std::string field;
    if (found->implementation != info.implementation) {
        field = "implementation";
        diff.emplace(found->implementation, info.implementation);
    } else if (found->architecture != info.architecture) {
        field = "architecture";
        diff.emplace(std::to_string(found->architecture), std::to_string(info.architecture));
    } else if (found->version_info != info.version_info) {
        field = "version_info";
        diff.emplace(found->version_info.str(5), info.version_info.str(5));
    }
    if (!diff) return found;
    logger()->debug("refused interpreter {} because {} differs {} != {}", found->executable.value_or(exe_path), field,
                    diff->first, diff->second);
    if (!exact) discovered.push_back(std::move(*found));
    return std::nullopt;
}

PythonInfo Session::discover_exe(const PythonInfo& info, const std::string& prefix, bool exact, const Env& env) {
    auto key = std::make_pair(prefix, exact);
    auto cached = discovered_exes.find(key);
    if (cached != discovered_exes.end() && !prefix.empty()) {
        logger()->debug("discover exe from cache {} - exact {}: {}", prefix, exact, cached->second.str());
        return cached->second;
    }
    logger()->debug("discover exe for {} in {}", info.str(), prefix);
    std::vector<std::string> names = possible_exe_names(info);
    std::vector<std::string> folders = possible_folders(info, prefix);
    std::vector<PythonInfo> discovered;
    for (const auto& folder : folders) {
        for (const auto& name : names) {
            auto found = check_exe(info, folder, name, exact, discovered, env);
            if (found) {
                discovered_exes[key] = *found;
                return *found;
            }
        }
    }
    std::string folder_list = join(folders, std::string(1, kPathSep));
    if (!exact && !discovered.empty()) {
        PythonInfo chosen = select_most_likely(discovered, info);
        discovered_exes[key] = chosen;
        logger()->debug("no exact match found, chosen most similar of {} within base folders {}", chosen.str(), folder_list);
        return chosen;
    }
    throw DiscoveryExhausted(fmt::format("failed to detect {} in {}", join(names, "|"), folder_list));
}

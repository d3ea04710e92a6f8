#include "pyfind_match.h"

bool satisfies(const PythonInfo& info, const PythonSpec& spec, bool impl_must_match) {
    if (spec.path) {
        if (info.executable && *info.executable == abs_path(*spec.path)) return true;
        if (spec.is_abs()) return false;
        std::string basename = fs::path(info.original_executable.value_or("")).filename().string();
        std::string spec_path = *spec.path;
        if (kIsWindows) {
            std::string suffix = fs::path(basename).extension().string();
            basename = fs::path(basename).stem().string();
            if (!suffix.empty() && spec_path.size() >= suffix.size() &&
                spec_path.compare(spec_path.size() - suffix.size(), suffix.size(), suffix) == 0)
                spec_path.resize(spec_path.size() - suffix.size());
        }
        if (basename != spec_path) return false;
    }
    if (impl_must_match && spec.implementation && to_lower(*spec.implementation) != to_lower(info.implementation))
        return false;
    if (spec.architecture && *spec.architecture != info.architecture) return false;
    const int64_t ours[] = {info.version_info.major, info.version_info.minor, info.version_info.micro};
    const std::optional<int64_t> required[] = {spec.major, spec.minor, spec.micro};
    for (int i = 0; i < 3; ++i) {
        if (required[i] && *required[i] != ours[i]) return false;
    }
    return true;
}

const PythonInfo& select_most_likely(const std::vector<PythonInfo>& candidates, const PythonInfo& target) {
    if (candidates.empty()) throw std::runtime_error("no candidates to choose from");
    auto score = [&](const PythonInfo& info) {
        const VersionInfo& a = info.version_info;
        const VersionInfo& b = target.version_info;
        // most significant first
        const bool matches[] = {
            info.implementation == target.implementation,
            a.major == b.major,
            a.minor == b.minor,
            info.architecture == target.architecture,
            a.micro == b.micro,
            a.releaselevel == b.releaselevel,
            a.serial == b.serial,
        };
        int value = 0;
        for (bool m : matches) value = (value << 1) | (m ? 1 : 0);
        return value;
    };
    std::vector<size_t> order(candidates.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t l, size_t r) { return score(candidates[l]) > score(candidates[r]); });
    return candidates[order.front()];
}

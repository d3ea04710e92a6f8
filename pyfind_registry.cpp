#include "pyfind_registry.h"
#include "pyfind_log.h"

namespace {

const std::string PYTHON_KEY = "Software\\Python";

struct RegistryRoot {
    RegistryHive hive;
    const char* name;
    RegistryView view;
    int default_arch;
};

const RegistryRoot ROOTS[] = {
    {RegistryHive::CurrentUser, "HKEY_CURRENT_USER", RegistryView::Default, 64},
    {RegistryHive::LocalMachine, "HKEY_LOCAL_MACHINE", RegistryView::Bits64, 64},
    {RegistryHive::LocalMachine, "HKEY_LOCAL_MACHINE", RegistryView::Bits32, 32},
};

void violation(const std::string& at, const std::string& what) {
    logger()->warn("PEP-514 violation in Windows Registry at {} error: {}", at, what);
}

std::string value_repr(const RegistryValue& v) {
    if (auto s = std::get_if<std::string>(&v)) return "'" + *s + "'";
    return std::to_string(std::get<uint32_t>(v));
}

struct ParsedVersion {
    int major;
    std::optional<int> minor;
};

// throws std::invalid_argument carrying the violation text
ParsedVersion parse_version(const RegistryValue& raw) {
    static const std::regex pattern(R"(^(\d+)(?:\.(\d+))?(?:\.(\d+))?$)");
    auto text = std::get_if<std::string>(&raw);
    if (!text) throw std::invalid_argument("version is not string: " + value_repr(raw));
    std::smatch m;
    if (!std::regex_match(*text, m, pattern)) throw std::invalid_argument("invalid format " + *text);
    try {
        ParsedVersion v{std::stoi(m[1].str()), std::nullopt};
        if (m[2].matched) v.minor = std::stoi(m[2].str());
        return v;
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("invalid format " + *text);
    }
}

int parse_arch(const RegistryValue& raw) {
    static const std::regex pattern(R"(^(\d+)bit$)");
    auto text = std::get_if<std::string>(&raw);
    if (!text) throw std::invalid_argument("arch is not string: " + value_repr(raw));
    std::smatch m;
    if (!std::regex_match(*text, m, pattern)) throw std::invalid_argument("invalid format " + *text);
    try {
        return std::stoi(m[1].str());
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("invalid format " + *text);
    }
}

std::optional<std::string> text_value(const RegistryBackend& reg, const RegistryRoot& root, const std::string& key,
                                      const std::string& name) {
    auto v = reg.value(root.hive, root.view, key, name);
    if (!v) return std::nullopt;
    if (auto s = std::get_if<std::string>(&*v)) return *s;
    return std::to_string(std::get<uint32_t>(*v));
}

std::optional<ParsedVersion> load_version(const RegistryBackend& reg, const RegistryRoot& root,
                                          const std::string& tag_key, const std::string& at, const std::string& tag) {
    std::vector<std::pair<std::optional<RegistryValue>, std::string>> sources{
        {reg.value(root.hive, root.view, tag_key, "SysVersion"), at + "/SysVersion"},
        {RegistryValue(tag), at},
    };
    for (const auto& [candidate, where] : sources) {
        if (!candidate) continue;
        try {
            return parse_version(*candidate);
        } catch (const std::invalid_argument& e) {
            violation(where, e.what());
        }
    }
    return std::nullopt;
}

std::optional<int> load_arch(const RegistryBackend& reg, const RegistryRoot& root, const std::string& tag_key,
                             const std::string& at) {
    auto raw = reg.value(root.hive, root.view, tag_key, "SysArchitecture");
    if (!raw) return root.default_arch;
    try {
        return parse_arch(*raw);
    } catch (const std::invalid_argument& e) {
        violation(at + "/SysArchitecture", e.what());
        return std::nullopt;
    }
}

std::optional<std::pair<std::string, std::optional<std::string>>> load_exe(const RegistryBackend& reg,
                                                                           const RegistryRoot& root,
                                                                           const std::string& tag_key,
                                                                           const std::string& at) {
    std::string install_key = tag_key + "\\InstallPath";
    if (!reg.has_key(root.hive, root.view, install_key)) {
        violation(at + "/InstallPath", "missing");
        return std::nullopt;
    }
    std::optional<std::string> exe = text_value(reg, root, install_key, "ExecutablePath");
    if (!exe) {
        auto install_path = text_value(reg, root, install_key, "");
        if (!install_path) {
            violation(at, "no ExecutablePath or default for it");
        } else {
            std::string folder = *install_path;
            while (!folder.empty() && folder.back() == '\\') folder.pop_back();
            exe = folder + "\\python.exe";
        }
    }
    if (exe && reg.file_exists(*exe)) return std::make_pair(*exe, text_value(reg, root, install_key, "ExecutableArguments"));
    violation(at, "could not load exe with value " + exe.value_or("None"));
    return std::nullopt;
}

}  // namespace

std::vector<Pep514Entry> discover_pythons(const RegistryBackend& reg) {
    std::vector<Pep514Entry> found;
    for (const auto& root : ROOTS) {
        if (!reg.has_key(root.hive, root.view, PYTHON_KEY)) continue;
        for (const auto& company : reg.subkeys(root.hive, root.view, PYTHON_KEY)) {
            if (company == "PyLauncher") continue;  // reserved
            std::string company_key = PYTHON_KEY + "\\" + company;
            for (const auto& tag : reg.subkeys(root.hive, root.view, company_key)) {
                std::string tag_key = company_key + "\\" + tag;
                std::string at = std::string(root.name) + "/" + company + "/" + tag;
                auto version = load_version(reg, root, tag_key, at, tag);
                if (!version) continue;
                auto arch = load_arch(reg, root, tag_key, at);
                if (!arch) continue;
                auto exe = load_exe(reg, root, tag_key, at);
                if (!exe) continue;
                found.push_back({company, version->major, version->minor, *arch, exe->first, exe->second});
            }
        }
    }
    return found;
}

std::vector<Pep514Entry> pep514_proposals(std::vector<Pep514Entry> entries, const PythonSpec& spec) {
    auto rank = [](const Pep514Entry& e) {
        return std::make_tuple(e.major, e.minor.value_or(-1), e.architecture, e.company == "PythonCore" ? 1 : 0);
    };
    std::stable_sort(entries.begin(), entries.end(),
                     [&](const Pep514Entry& l, const Pep514Entry& r) { return rank(l) > rank(r); });
    std::vector<Pep514Entry> proposals;
    for (auto& entry : entries) {
        std::string implementation = entry.company == "PythonCore" ? "CPython" : entry.company;
        // only CPython registrations are trusted enough to filter on before probing
        if (to_lower(implementation) == "cpython") {
            PythonSpec registered;
            registered.implementation = implementation;
            registered.major = entry.major;
            registered.minor = entry.minor;
            registered.architecture = entry.architecture;
            registered.path = entry.exe;
            if (!registered.satisfies(spec)) continue;
        }
        proposals.push_back(std::move(entry));
    }
    return proposals;
}

std::string to_string(const Pep514Entry& e) {
    return fmt::format("('{}', {}, {}, {}, '{}', {})", e.company, e.major,
                       e.minor ? std::to_string(*e.minor) : "None", e.architecture, e.exe,
                       e.args ? "'" + *e.args + "'" : std::string("None"));
}

#ifndef _WIN32
namespace {

class EmptyRegistry : public RegistryBackend {
public:
    bool has_key(RegistryHive, RegistryView, const std::string&) const override { return false; }
    std::vector<std::string> subkeys(RegistryHive, RegistryView, const std::string&) const override { return {}; }
    std::optional<RegistryValue> value(RegistryHive, RegistryView, const std::string&, const std::string&) const override {
        return std::nullopt;
    }
    bool file_exists(const std::string& path) const override { return path_exists(path); }
};

}  // namespace

std::unique_ptr<RegistryBackend> make_registry_backend() {
    return std::make_unique<EmptyRegistry>();
}
#endif

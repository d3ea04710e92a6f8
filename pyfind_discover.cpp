#include "pyfind_discover.h"
#include "pyfind_match.h"
#include "pyfind_registry.h"
#include "pyfind_log.h"

namespace {

bool propose_registered(const PythonSpec& spec, const std::function<bool(const Candidate&)>& visit) {
    auto registry = make_registry_backend();
    for (const auto& entry : pep514_proposals(discover_pythons(*registry), spec)) {
        if (visit({entry.exe, true, nullptr})) return true;
    }
    return false;
}

}  // namespace

void propose_interpreters(Session& session, const PythonSpec& spec, const std::vector<std::string>& try_first_with,
                          const Env& env, const std::function<bool(const Candidate&)>& visit) {
    for (const auto& exe : try_first_with) {
        std::string path = abs_path(exe);
        if (path_exists(path) && visit({path, true, nullptr})) return;
    }

    if (spec.path) {
        if (path_exists(*spec.path)) {
            if (visit({abs_path(*spec.path), true, nullptr})) return;
        } else if (spec.is_abs()) {
            throw AbsolutePathMiss(*spec.path);
        }
        if (spec.is_abs()) return;
    } else {
        if (!session.host().empty()) {
            try {
                const PythonInfo& current = session.current_system();
                if (visit({current.executable.value_or(session.host()), true, &current})) return;
            } catch (const std::runtime_error& e) {
                logger()->info("ignore host interpreter {} due to {}", session.host(), e.what());
            }
        }
        if (kIsWindows && propose_registered(spec, visit)) return;
    }

    // PATH last, it is the source end users control the least deliberately
    std::set<std::string> tested_exes;
    auto paths = get_paths(env);
    for (size_t pos = 0; pos < paths.size(); ++pos) {
        logger()->debug("{}", path_dump(pos, paths[pos], env));
        for (const auto& [candidate, match] : possible_specs(spec)) {
            auto found = check_path(candidate, paths[pos]);
            if (!found) continue;
            std::string exe = abs_path(*found);
            if (!tested_exes.insert(exe).second) continue;
            if (visit({exe, match, nullptr})) return;
        }
    }
}

std::optional<PythonInfo> get_interpreter(Session& session, const std::string& key,
                                          const std::vector<std::string>& try_first_with, const Env& env) {
    PythonSpec spec = PythonSpec::from_string_spec(key);
    logger()->info("find interpreter for spec {}", spec.repr());
    std::set<std::pair<std::string, bool>> proposed;
    std::optional<PythonInfo> result;
    propose_interpreters(session, spec, try_first_with, env, [&](const Candidate& c) {
        if (!proposed.insert({abs_path(c.exe), c.impl_must_match}).second) return false;
        std::optional<PythonInfo> info = c.known ? std::optional<PythonInfo>(*c.known) : session.from_exe(c.exe, env, false);
        if (!info) return false;
        logger()->info("proposed {}", info->str());
        if (!satisfies(*info, spec, c.impl_must_match)) return false;
        logger()->debug("accepted {}", info->str());
        result = std::move(info);
        return true;
    });
    return result;
}

Builtin::Builtin(Session& s, std::vector<std::string> specs, std::vector<std::string> try_first, Env e)
    : session(s), python_spec(std::move(specs)), try_first_with(std::move(try_first)), env(std::move(e)) {
    if (python_spec.empty() && !session.host().empty()) python_spec.push_back(session.host());
}

std::optional<PythonInfo> Builtin::run() {
    for (const auto& spec : python_spec) {
        auto result = get_interpreter(session, spec, try_first_with, env);
        if (result) return result;
    }
    return std::nullopt;
}

const std::optional<PythonInfo>& Builtin::interpreter() {
    if (!has_run) {
        found = run();
        has_run = true;
    }
    return found;
}

std::string Builtin::repr() const {
    std::string spec = python_spec.size() == 1 ? "'" + python_spec[0] + "'"
                       : python_spec.empty() ? "[]" : "['" + join(python_spec, "', '") + "']";
    return "Builtin discover of python_spec=" + spec;
}

std::optional<PythonInfo> resolve(Session& session, const std::vector<std::string>& specs,
                                  const std::vector<std::string>& try_first_with, const Env& env) {
    return Builtin(session, specs, try_first_with, env).run();
}

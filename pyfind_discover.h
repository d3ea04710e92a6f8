#pragma once
#include "pyfind_session.h"
#include "pyfind_spec.h"

struct Candidate {
    std::string exe;
    bool impl_must_match = true;
    const PythonInfo* known = nullptr;  // already probed
};

// Feeds `visit` the candidates for `spec` in priority order, stops once it returns true.
void propose_interpreters(Session& session, const PythonSpec& spec, const std::vector<std::string>& try_first_with,
                          const Env& env, const std::function<bool(const Candidate&)>& visit);

std::optional<PythonInfo> get_interpreter(Session& session, const std::string& key,
                                          const std::vector<std::string>& try_first_with, const Env& env);

std::vector<std::string> get_paths(const Env& env);
std::optional<std::string> check_path(const std::string& candidate, const std::string& dir);
std::vector<std::pair<std::string, bool>> possible_specs(const PythonSpec& spec);
std::string path_dump(size_t pos, const std::string& dir, const Env& env);

enum class DiscoverKind { Builtin };

// Tries each requested spec in turn, defaulting to the host interpreter.
class Builtin {
    Session& session;
    std::vector<std::string> python_spec;
    std::vector<std::string> try_first_with;
    Env env;
    bool has_run = false;
    std::optional<PythonInfo> found;
public:
    static constexpr DiscoverKind kind = DiscoverKind::Builtin;

    Builtin(Session& s, std::vector<std::string> specs, std::vector<std::string> try_first, Env e);
    std::optional<PythonInfo> run();
    // run() once, then its remembered answer
    const std::optional<PythonInfo>& interpreter();
    std::string repr() const;
};

std::optional<PythonInfo> resolve(Session& session, const std::vector<std::string>& specs,
                                  const std::vector<std::string>& try_first_with, const Env& env);

#include "pyfind_probe.h"
#include "pyfind_log.h"

ProbeFailure::ProbeFailure(const std::string& e, int c, const std::string& o, const std::string& er)
    : std::runtime_error(fmt::format("failed to query {} with code {}{}{}", e, c, o.empty() ? "" : " out: " + o,
                                     er.empty() ? "" : " err: " + er)),
      exe(e), code(c), out(o), err(er) {}

std::string extract_payload(const std::string& out, const std::string& start_cookie, const std::string& end_cookie,
                            std::string& noise) {
    std::string start(start_cookie.rbegin(), start_cookie.rend());
    std::string end(end_cookie.rbegin(), end_cookie.rend());
    std::string body = out;
    size_t begin = body.find(start);
    if (begin != std::string::npos) {
        noise += body.substr(0, begin);
        body = body.substr(begin + start.size());
    }
    size_t finish = body.find(end);
    if (finish != std::string::npos) {
        std::string trailer = body.substr(finish + end.size());
        body.resize(finish);
        noise += trailer;
    }
    return body;
}

PythonInfo run_probe(const std::string& exe, const Env& env) {
    std::string start_cookie = gen_cookie();
    std::string end_cookie = gen_cookie();
    // the launcher variable would make the child report our prefix instead of its own
    Env child_env = env;
    child_env.erase("__PYVENV_LAUNCHER__");

    std::vector<std::string> cmd{exe, "-c", probe_script(), start_cookie, end_cookie};
    if (logger()->should_log(spdlog::level::debug)) {
        std::vector<std::string> shown;
        for (const auto& arg : cmd) shown.push_back(&arg == &cmd[2] ? "<probe script>" : quote_arg(arg));
        logger()->debug("get interpreter info via cmd: {}", join(shown, " "));
    }

    ProcessResult res = run_process(cmd, child_env);
    if (res.code != 0) throw ProbeFailure(exe, res.code, res.out, res.err);

    std::string noise;
    std::string payload = extract_payload(res.out, start_cookie, end_cookie, noise);
    if (!noise.empty()) std::cout << noise << std::flush;
    PythonInfo info;
    try {
        info = PythonInfo::from_json(payload);
    } catch (const std::runtime_error& e) {
        throw ProbeFailure(exe, res.code, res.out, res.err.empty() ? e.what() : res.err + " " + e.what());
    }
    info.executable = exe;
    return info;
}

#include "pyfind_cmd.h"
#include "pyfind_discover.h"
#include "pyfind_registry.h"
#include "pyfind_log.h"

namespace {

constexpr std::string_view USAGE =
    "Usage: pyfind [-p|--python SPEC]... [--try-first-with EXE]... [-v|-vv|-q] [--pep514] [--json]\n"
    "  -p, --python SPEC       interpreter to look for (path or e.g. cpython3.11-64), first found wins\n"
    "  --try-first-with EXE    interpreters to try before the discovery starts\n"
    "  -v, -vv, -q             more or less logging\n"
    "  --pep514                list the interpreters registered in the Windows registry\n"
    "  --json                  print the full interpreter record as JSON\n";

void print_summary(const PythonInfo& info) {
    std::cout << GREEN << "✅ " << info.spec() << RESET << " " << info.executable.value_or("") << std::endl;
    std::cout << "   " << CYAN << "system:  " << RESET << info.system_executable.value_or("unknown") << std::endl;
    std::cout << "   " << CYAN << "prefix:  " << RESET << info.prefix.value_or("unknown") << std::endl;
    std::cout << "   " << CYAN << "scripts: " << RESET << info.install_path("scripts") << std::endl;
    std::cout << "   " << CYAN << "purelib: " << RESET << info.install_path("purelib") << std::endl;
}

int list_pep514() {
    auto registry = make_registry_backend();
    std::vector<std::string> lines;
    for (const auto& entry : discover_pythons(*registry)) lines.push_back(to_string(entry));
    std::sort(lines.begin(), lines.end());
    for (const auto& line : lines) std::cout << line << std::endl;
    return 0;
}

}  // namespace

bool parse_args(Config& cfg, const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-p" || arg == "--python" || arg == "--try-first-with") {
            if (i + 1 >= args.size()) {
                std::cerr << RED << "Missing value for " << arg << RESET << "\n" << USAGE;
                return false;
            }
            (arg == "--try-first-with" ? cfg.try_first_with : cfg.python_spec).push_back(args[++i]);
        } else if (arg.rfind("--python=", 0) == 0) cfg.python_spec.push_back(arg.substr(9));
        else if (arg.rfind("--try-first-with=", 0) == 0) cfg.try_first_with.push_back(arg.substr(17));
        else if (arg == "-v") cfg.log_level = spdlog::level::info;
        else if (arg == "-vv") cfg.log_level = spdlog::level::debug;
        else if (arg == "-q") cfg.log_level = spdlog::level::err;
        else if (arg == "--pep514") cfg.list_pep514 = true;
        else if (arg == "--json") cfg.json_output = true;
        else {
            std::cerr << RED << "Unknown argument: " << arg << RESET << "\n" << USAGE;
            return false;
        }
    }
    return true;
}

int run_command(Config& cfg, const std::vector<std::string>& args) {
    if (std::find(args.begin(), args.end(), "-h") != args.end() || std::find(args.begin(), args.end(), "--help") != args.end()) {
        std::cout << USAGE;
        return 0;
    }
    if (!parse_args(cfg, args)) return 2;
    init_logging(cfg.log_level);
    try {
        if (cfg.list_pep514) return list_pep514();
        Session session(cfg.host_python, cfg.env);
        auto found = resolve(session, cfg.python_spec, cfg.try_first_with, cfg.env);
        if (!found) {
            std::cerr << YELLOW << "No interpreter found" << RESET << std::endl;
            return 1;
        }
        if (cfg.json_output) std::cout << found->to_json() << std::endl;
        else print_summary(*found);
        return 0;
    } catch (const std::runtime_error& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 2;
    }
}

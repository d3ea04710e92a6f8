#include "pyfind_env.h"
#include "pyfind_cmd.h"

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.push_back(argv[i]);
    Config cfg = init_config();
    return run_command(cfg, args);
}

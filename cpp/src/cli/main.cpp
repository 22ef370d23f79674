#include <cstdio>
#include <cstdlib>

#include "ocid/cli/tool.hpp"

int main(int argc, char** argv) {
    if (argc < 1) {
        return EXIT_FAILURE;
    }

    const ocid::cli::CliConfig cfg = ocid::cli::load_config_from_env(stderr);
    const ocid::cli::CliArgs args{argv + 1, static_cast<ocid::cli::u32>(argc - 1)};
    return ocid::cli::run_tool(args, cfg, stdout, stderr);
}

#include <csignal>
#include <iostream>

#include "cli/commands.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/logger.h"

namespace {

void signalHandler(int) {
    segdl::request_interrupt();
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse CLI arguments first
    auto cli_result = segdl::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        if (cli_result.exit_code == 0) {
            std::cout << cli_result.output;
        } else {
            std::cerr << cli_result.output;
        }
        return cli_result.exit_code;
    }

    bool verbose = false;
    if (cli_result.subcommand == segdl::Subcommand::Download) {
        verbose = cli_result.download_options.verbose;
    } else if (cli_result.subcommand == segdl::Subcommand::Probe) {
        verbose = cli_result.probe_options.verbose;
    }
    segdl::logger::init_from_env(verbose ? "info" : "warn");

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    switch (cli_result.subcommand) {
        case segdl::Subcommand::Download:
            return segdl::cli::commands::download(cli_result.download_options);
        case segdl::Subcommand::Probe:
            return segdl::cli::commands::probe(cli_result.probe_options);
        case segdl::Subcommand::None:
        default:
            std::cerr << segdl::getHelpMessage();
            return 1;
    }
}

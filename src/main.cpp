#include "core/cli.hpp"
#include "core/config.hpp"
#include "daemon/daemon.hpp"

static int run_daemon() {
    Config config;
    config.load();

    // SIGTERM/SIGINT are routed through the daemon's event loop
    Daemon daemon(config);
    return daemon.run();
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // daemon subcommand
        return run_daemon();
    }
    return cli_result;
}

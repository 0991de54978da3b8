#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "daemon/ipc_client.hpp"
#include "supervisor/registry.hpp"

#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <signal.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return 1;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "run") == 0) {
        return cmd_run(argc, argv);
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start(argc, argv);
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop(argc, argv);
    }
    if (std::strcmp(cmd, "restart") == 0) {
        return cmd_restart(argc, argv);
    }
    if (std::strcmp(cmd, "stopall") == 0) {
        return cmd_stopall();
    }
    if (std::strcmp(cmd, "list") == 0 || std::strcmp(cmd, "ls") == 0) {
        return cmd_list();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'minipm help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "minipm - minimal process manager for node and python scripts\n"
        "\n"
        "Usage:\n"
        "  minipm run <script> [options] [-- args]      Supervise one script in the foreground\n"
        "  minipm daemon                                Run the supervisor daemon\n"
        "  minipm start <name> [script] [options] [-- args]  Start a process in the daemon\n"
        "  minipm stop <name>                           Stop every process called <name>\n"
        "  minipm restart <name>                        Restart every process called <name>\n"
        "  minipm stopall                               Stop everything\n"
        "  minipm list                                  List supervised processes\n"
        "  minipm status                                Show daemon status\n"
        "  minipm version                               Show version\n"
        "  minipm help                                  Show this help\n"
        "\n"
        "Options:\n"
        "  --name <name>      Process name (run only)\n"
        "  --cwd <dir>        Working directory; package.json \"main\" is used when no script is given\n"
        "  --log <file>       Append output to <file> instead of stdout/stderr\n"
        "  --env KEY=VALUE    Extra environment variable (repeatable)\n"
        "  --autorestart      Relaunch after an abnormal exit\n"
        "\n"
        "Script types:\n"
        "  .js .mjs .cjs      node, with an IPC channel for shutdown notification\n"
        "  .py                python\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "minipm " << APP_VERSION << "\n";
    return 0;
}

// ── argument parsing ────────────────────────────────────────

bool CLI::parse_launch_args(int argc, char* argv[], int first, bool script_first,
                            LaunchParams& params, std::string& err) {
    bool want_script = script_first;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            for (++i; i < argc; ++i) params.args.push_back(argv[i]);
            break;
        }
        if (arg == "--autorestart") {
            params.autorestart = true;
            continue;
        }
        if (arg == "--name" || arg == "--cwd" || arg == "--log" || arg == "--env") {
            if (i + 1 >= argc) {
                err = "Missing value for " + arg;
                return false;
            }
            std::string value = argv[++i];
            if (arg == "--name") {
                params.name = value;
            } else if (arg == "--cwd") {
                params.cwd = value;
            } else if (arg == "--log") {
                params.log = value;
            } else {
                auto eq = value.find('=');
                if (eq == std::string::npos || eq == 0) {
                    err = "Expected KEY=VALUE for --env, got " + value;
                    return false;
                }
                params.env[value.substr(0, eq)] = value.substr(eq + 1);
            }
            continue;
        }
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            err = "Unknown option: " + arg;
            return false;
        }

        if (!want_script && params.name.empty()) {
            params.name = arg;
            want_script = true;
        } else if (params.script.empty()) {
            params.script = arg;
        } else {
            err = "Unexpected argument: " + arg + " (pass script arguments after --)";
            return false;
        }
    }
    return true;
}

// ── run (foreground) ────────────────────────────────────────

int CLI::cmd_run(int argc, char* argv[]) {
    LaunchParams params;
    std::string err;
    if (!parse_launch_args(argc, argv, 2, true, params, err)) {
        std::cerr << err << "\n";
        return 1;
    }

    Config config;
    config.load();
    const auto& d = config.data();

    Registry::Options options;
    options.stop_timeout_ms = d.stop_timeout_ms;
    options.restart_delay_ms = d.restart_delay_ms;

    EventLoop loop;
    Registry registry(loop, StrategyTable::with_defaults(d.node_binary, d.python_binary), options);

    registry.on_stopping([]() {
        std::cerr << "minipm: stopping...\n";
    });
    auto on_signal = [&registry](int) {
        registry.run_stopping_hook();
        registry.stop_all();
    };
    loop.on_signal(SIGINT, on_signal);
    loop.on_signal(SIGTERM, on_signal);

    bool done = false;
    int exit_code = 0;
    registry.start(params, [&](const Outcome& outcome) {
        if (outcome.stage == Outcome::Stage::Launch) {
            if (!outcome.success) {
                std::cerr << "minipm: " << outcome.error << "\n";
                exit_code = 1;
                done = true;
            }
            return;
        }
        if (!outcome.success) {
            std::cerr << "minipm: " << outcome.error << "\n";
        }
        if (outcome.exit_code >= 0) {
            exit_code = outcome.exit_code;
        } else if (outcome.signal != 0) {
            exit_code = 128 + outcome.signal;
        } else {
            exit_code = 1;
        }
        // With autorestart a new launch follows; keep supervising
        if (!params.autorestart || outcome.success || outcome.stopped) {
            done = true;
        }
    });

    while (!done) {
        loop.run_once(-1);
    }

    loop.clear_signal(SIGINT);
    loop.clear_signal(SIGTERM);
    return exit_code;
}

// ── daemon commands ─────────────────────────────────────────

static DaemonClient daemon_client() {
    Config config;
    config.load();
    return DaemonClient(config.socket_path());
}

void CLI::resolve_paths(LaunchParams& params) {
    namespace fs = std::filesystem;
    std::error_code ec;
    auto absolute = [&ec](std::string& path) {
        if (path.empty()) return;
        fs::path abs = fs::absolute(path, ec);
        if (!ec) path = abs.lexically_normal().string();
    };
    if (params.cwd.empty()) absolute(params.script);
    absolute(params.cwd);
    absolute(params.log);
}

int CLI::cmd_start(int argc, char* argv[]) {
    LaunchParams params;
    std::string err;
    if (!parse_launch_args(argc, argv, 2, false, params, err)) {
        std::cerr << err << "\n";
        return 1;
    }
    if (params.name.empty()) {
        std::cerr << "Usage: minipm start <name> [script] [options] [-- args]\n";
        return 1;
    }

    resolve_paths(params);
    auto dc = daemon_client();
    if (!dc.start(params, err)) {
        std::cerr << "Failed to start " << params.name << ": " << err << "\n";
        return 1;
    }
    std::cout << "Started " << params.name << "\n";
    return 0;
}

int CLI::cmd_stop(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: minipm stop <name>\n";
        return 1;
    }
    std::string err;
    auto dc = daemon_client();
    if (!dc.stop(argv[2], err)) {
        std::cerr << "Failed to stop " << argv[2] << ": " << err << "\n";
        return 1;
    }
    std::cout << "Stopped " << argv[2] << "\n";
    return 0;
}

int CLI::cmd_restart(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: minipm restart <name>\n";
        return 1;
    }
    std::string err;
    std::size_t matched = 0;
    auto dc = daemon_client();
    if (!dc.restart(argv[2], matched, err)) {
        std::cerr << "Failed to restart " << argv[2] << ": " << err << "\n";
        return 1;
    }
    std::cout << "Restarting " << matched << " process(es) named " << argv[2] << "\n";
    return 0;
}

int CLI::cmd_stopall() {
    std::string err;
    auto dc = daemon_client();
    if (!dc.stop_all(err)) {
        std::cerr << "Failed to stop processes: " << err << "\n";
        return 1;
    }
    return 0;
}

int CLI::cmd_list() {
    auto dc = daemon_client();
    if (!dc.is_daemon_running()) {
        std::cerr << "Daemon is not running. Start it with 'minipm daemon'.\n";
        return 1;
    }

    auto processes = dc.list();
    if (processes.empty()) {
        std::cout << "No processes.\n";
        return 0;
    }

    std::cout << std::left
              << std::setw(20) << "NAME"
              << std::setw(8) << "PID"
              << std::setw(12) << "STATE"
              << std::setw(8) << "TYPE"
              << "SCRIPT\n";
    for (const auto& p : processes) {
        std::string state = p.stopping ? p.state + "*" : p.state;
        std::cout << std::left
                  << std::setw(20) << (p.name.empty() ? "-" : p.name)
                  << std::setw(8) << p.pid
                  << std::setw(12) << state
                  << std::setw(8) << p.family
                  << p.script << "\n";
    }
    return 0;
}

int CLI::cmd_status() {
    auto dc = daemon_client();
    auto st = dc.get_status();
    std::cout << "Daemon:    " << (st.running ? "running (pid " + std::to_string(st.pid) + ")" : "stopped") << "\n";
    if (st.running) {
        std::cout << "Processes: " << st.processes << "\n";
        if (st.shutting_down) {
            std::cout << "State:     shutting down\n";
        }
    }
    return 0;
}

#pragma once

#include "supervisor/launch_params.hpp"

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for "daemon" (caller runs the daemon).
    static int run(int argc, char* argv[]);

    /// Parse [script] [--name n] [--cwd d] [--log f] [--env K=V] [--autorestart] [-- args...]
    /// starting at argv[first]. The first bare word fills script unless
    /// script_first is false, in which case it fills name.
    static bool parse_launch_args(int argc, char* argv[], int first, bool script_first,
                                  LaunchParams& params, std::string& err);

    /// Make cwd and log absolute against our own working directory, and
    /// the script too when no cwd is given (the child resolves a relative
    /// script against its cwd). Done before anything goes to the daemon,
    /// which runs from elsewhere.
    static void resolve_paths(LaunchParams& params);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_run(int argc, char* argv[]);
    static int cmd_start(int argc, char* argv[]);
    static int cmd_stop(int argc, char* argv[]);
    static int cmd_restart(int argc, char* argv[]);
    static int cmd_stopall();
    static int cmd_list();
    static int cmd_status();
};

#pragma once

#include <map>
#include <string>
#include <vector>

/// Caller-supplied description of a process to supervise
struct LaunchParams {
    std::string name;          // may be empty: then stop/restart cannot address it
    std::string script;        // explicit script; resolved from cwd/package.json when empty
    std::string cwd;           // child working directory and manifest location
    std::string log;           // append output here; empty = our own stdout/stderr
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // added on top of the supervisor's environment
    bool autorestart = false;  // relaunch after an abnormal exit nobody asked for
};

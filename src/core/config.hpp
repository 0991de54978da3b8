#pragma once

#include "supervisor/launch_params.hpp"

#include <string>
#include <vector>

struct AppConfig {
    // Interpreters
    std::string node_binary = "node";
    std::string python_binary = "python";

    // Supervisor
    int stop_timeout_ms = 5000;
    int restart_delay_ms = 3000;
    std::string socket_path;  // empty = <config_dir>/minipm.sock

    // Processes launched when the daemon starts
    std::vector<LaunchParams> processes;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    /// Load from / save to an explicit file instead of config_path()
    bool load_from(const std::string& path);
    bool save_to(const std::string& path);

    AppConfig& data();
    const AppConfig& data() const;

    /// Configured socket path, or the default one in config_dir()
    std::string socket_path() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};

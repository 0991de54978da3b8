#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/minipm";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/minipm";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::socket_path() const {
    if (!config_.socket_path.empty()) {
        return expand_home(config_.socket_path);
    }
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/minipm.sock";
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsMap()) return false;

        // Parse into a copy so a bad entry leaves the current values intact
        AppConfig next = config_;

        // Interpreters section
        if (auto interp = root["interpreters"]) {
            next.node_binary = interp["node"].as<std::string>(next.node_binary);
            next.python_binary = interp["python"].as<std::string>(next.python_binary);
        }

        // Supervisor section
        if (auto sup = root["supervisor"]) {
            next.stop_timeout_ms = sup["stop_timeout_ms"].as<int>(next.stop_timeout_ms);
            next.restart_delay_ms = sup["restart_delay_ms"].as<int>(next.restart_delay_ms);
            next.socket_path = sup["socket_path"].as<std::string>(next.socket_path);
        }

        // Processes section
        if (auto procs = root["processes"]) {
            next.processes.clear();
            for (const auto& proc : procs) {
                LaunchParams params;
                params.name = proc["name"].as<std::string>("");
                params.script = expand_home(proc["script"].as<std::string>(""));
                params.cwd = expand_home(proc["cwd"].as<std::string>(""));
                params.log = expand_home(proc["log"].as<std::string>(""));
                params.autorestart = proc["autorestart"].as<bool>(false);
                if (auto args = proc["args"]) {
                    for (const auto& arg : args) {
                        params.args.push_back(arg.as<std::string>());
                    }
                }
                if (auto env = proc["env"]) {
                    for (const auto& kv : env) {
                        params.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
                    }
                }
                next.processes.push_back(std::move(params));
            }
        }

        config_ = std::move(next);
        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, previous values stay
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    if (dir.empty()) return false;
    try {
        fs::create_directories(dir);
    } catch (const fs::filesystem_error&) {
        return false;
    }
    return save_to(config_path());
}

bool Config::save_to(const std::string& path) {
    if (path.empty()) return false;

    YAML::Emitter out;
    out << YAML::BeginMap;

    // Interpreters section
    out << YAML::Key << "interpreters" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "node" << YAML::Value << config_.node_binary;
    out << YAML::Key << "python" << YAML::Value << config_.python_binary;
    out << YAML::EndMap;

    // Supervisor section
    out << YAML::Key << "supervisor" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "stop_timeout_ms" << YAML::Value << config_.stop_timeout_ms;
    out << YAML::Key << "restart_delay_ms" << YAML::Value << config_.restart_delay_ms;
    out << YAML::Key << "socket_path" << YAML::Value << config_.socket_path;
    out << YAML::EndMap;

    // Processes section
    out << YAML::Key << "processes" << YAML::Value << YAML::BeginSeq;
    for (const auto& proc : config_.processes) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << proc.name;
        if (!proc.script.empty()) out << YAML::Key << "script" << YAML::Value << proc.script;
        if (!proc.cwd.empty()) out << YAML::Key << "cwd" << YAML::Value << proc.cwd;
        if (!proc.log.empty()) out << YAML::Key << "log" << YAML::Value << proc.log;
        if (!proc.args.empty()) {
            out << YAML::Key << "args" << YAML::Value << YAML::BeginSeq;
            for (const auto& arg : proc.args) out << arg;
            out << YAML::EndSeq;
        }
        if (!proc.env.empty()) {
            out << YAML::Key << "env" << YAML::Value << YAML::BeginMap;
            for (const auto& kv : proc.env) {
                out << YAML::Key << kv.first << YAML::Value << kv.second;
            }
            out << YAML::EndMap;
        }
        out << YAML::Key << "autorestart" << YAML::Value << proc.autorestart;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout.is_open()) return false;
    fout << out.c_str();
    return fout.good();
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

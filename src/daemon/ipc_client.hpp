#pragma once

#include "supervisor/launch_params.hpp"
#include "supervisor/registry.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

class DaemonClient {
public:
    explicit DaemonClient(std::string socket_path);

    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    /// Launch a process under the daemon
    bool start(const LaunchParams& params, std::string& err);

    /// Stop every process with this name; waits until they have ended
    bool stop(const std::string& name, std::string& err);

    /// Restart every process with this name; matched receives the count
    bool restart(const std::string& name, std::size_t& matched, std::string& err);

    /// Stop everything the daemon supervises
    bool stop_all(std::string& err);

    /// Processes currently registered in the daemon
    std::vector<ProcessInfo> list();

    struct DaemonStatus {
        bool running = false;
        int pid = -1;
        std::size_t processes = 0;
        bool shutting_down = false;
    };

    /// Get daemon status
    DaemonStatus get_status();

private:
    std::string socket_path_;

    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);

    /// send_command for requests answered with a bare {"ok": ...}
    bool simple_command(const nlohmann::json& cmd, std::string& err);
};

#include "daemon/ipc_client.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

DaemonClient::DaemonClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

json DaemonClient::send_command(const json& cmd) {
    if (socket_path_.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Stopping waits for the children, so allow for the kill grace period
    struct timeval tv;
    tv.tv_sec = 30;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::exception&) {
        return json();
    }
}

bool DaemonClient::simple_command(const json& cmd, std::string& err) {
    auto resp = send_command(cmd);
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (resp.value("ok", false)) return true;
    err = resp.value("error", "Unknown error");
    return false;
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}});
    return !resp.empty() && resp.value("ok", false);
}

bool DaemonClient::start(const LaunchParams& params, std::string& err) {
    json cmd = {
        {"cmd", "start"},
        {"name", params.name},
        {"script", params.script},
        {"cwd", params.cwd},
        {"log", params.log},
        {"args", params.args},
        {"env", params.env},
        {"autorestart", params.autorestart}
    };
    return simple_command(cmd, err);
}

bool DaemonClient::stop(const std::string& name, std::string& err) {
    return simple_command({{"cmd", "stop"}, {"name", name}}, err);
}

bool DaemonClient::restart(const std::string& name, std::size_t& matched, std::string& err) {
    auto resp = send_command({{"cmd", "restart"}, {"name", name}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }
    matched = 0;
    if (resp.contains("data") && resp["data"].is_object()) {
        matched = resp["data"].value("matched", std::size_t(0));
    }
    return true;
}

bool DaemonClient::stop_all(std::string& err) {
    return simple_command({{"cmd", "stop_all"}}, err);
}

std::vector<ProcessInfo> DaemonClient::list() {
    std::vector<ProcessInfo> processes;
    auto resp = send_command({{"cmd", "list"}});
    if (resp.empty() || !resp.value("ok", false)) return processes;

    try {
        for (const auto& item : resp["data"]) {
            ProcessInfo info;
            info.name = item.value("name", "");
            info.script = item.value("script", "");
            info.family = item.value("family", "");
            info.pid = item.value("pid", -1);
            info.state = item.value("state", "");
            info.stopping = item.value("stopping", false);
            processes.push_back(std::move(info));
        }
    } catch (const json::exception&) {}

    return processes;
}

DaemonClient::DaemonStatus DaemonClient::get_status() {
    DaemonStatus status;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return status;

    try {
        auto& data = resp["data"];
        status.running = true;
        status.pid = data.value("pid", -1);
        status.processes = data.value("processes", std::size_t(0));
        status.shutting_down = data.value("shutting_down", false);
    } catch (const json::exception&) {}

    return status;
}

#include "daemon/daemon.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <signal.h>
#include <filesystem>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;
using json = nlohmann::json;

static const std::size_t MAX_REQUEST_BYTES = 65536;

static Registry::Options registry_options(const AppConfig& cfg) {
    Registry::Options options;
    options.stop_timeout_ms = cfg.stop_timeout_ms;
    options.restart_delay_ms = cfg.restart_delay_ms;
    return options;
}

// Terminal outcomes of daemon-managed processes only go to our own log
static Callback log_outcome(const std::string& name) {
    return [name](const Outcome& outcome) {
        if (!outcome.success) {
            report(default_diagnostics(), name + ": " + outcome.error);
        } else if (outcome.stage == Outcome::Stage::Exit) {
            report(default_diagnostics(), name + (outcome.stopped ? ": stopped" : ": exited"));
        }
    };
}

static json info_to_json(const ProcessInfo& info) {
    return {
        {"name", info.name},
        {"script", info.script},
        {"family", info.family},
        {"pid", info.pid},
        {"state", info.state},
        {"stopping", info.stopping}
    };
}

Daemon::Daemon(Config& config)
    : config_(config) {
    const AppConfig& cfg = config_.data();
    registry_ = std::make_unique<Registry>(
        loop_,
        StrategyTable::with_defaults(cfg.node_binary, cfg.python_binary),
        registry_options(cfg));
}

Daemon::~Daemon() {
    // Kills and reaps anything still running
    registry_.reset();
    for (const auto& entry : clients_) {
        close(entry.first);
    }
    clients_.clear();
    cleanup_socket();
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        loop_.unwatch(socket_fd_);
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = config_.socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    std::string path = config_.socket_path();
    if (path.empty()) return false;

    // Clean up any existing socket
    unlink(path.c_str());

    // Ensure directory exists
    try {
        fs::create_directories(fs::path(path).parent_path());
    } catch (const fs::filesystem_error&) {
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (socket_fd_ < 0) return false;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 16) < 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    loop_.watch(socket_fd_, [this]() { on_accept(); });
    return true;
}

void Daemon::on_accept() {
    while (true) {
        int client_fd = accept4(socket_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                report(default_diagnostics(), std::string("accept failed: ") + std::strerror(errno));
            }
            return;
        }
        Client client;
        client.id = next_client_id_++;
        clients_[client_fd] = std::move(client);
        loop_.watch(client_fd, [this, client_fd]() { on_client_readable(client_fd); });
    }
}

void Daemon::on_client_readable(int fd) {
    auto it = clients_.find(fd);
    if (it == clients_.end()) return;
    Client& client = it->second;

    char buf[1024];
    bool eof = false;
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            client.buffer.append(buf, static_cast<std::size_t>(n));
            if (client.buffer.size() > MAX_REQUEST_BYTES) {  // prevent abuse
                drop_client(fd);
                return;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        eof = true;
        break;
    }

    // One JSON line per connection
    auto newline = client.buffer.find('\n');
    if (newline == std::string::npos && !eof) return;

    std::string line = client.buffer.substr(0, newline);
    loop_.unwatch(fd);
    if (line.empty()) {
        drop_client(fd);
        return;
    }
    handle_command(fd, line);
}

void Daemon::respond(int fd, const json& response) {
    auto it = clients_.find(fd);
    if (it == clients_.end() || it->second.answered) return;
    it->second.answered = true;

    std::string msg = response.dump() + "\n";
    std::size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;  // client went away
        total += static_cast<std::size_t>(n);
    }
    drop_client(fd);
}

void Daemon::respond_to(int fd, unsigned long id, const json& response) {
    auto it = clients_.find(fd);
    if (it == clients_.end() || it->second.id != id) return;
    respond(fd, response);
}

void Daemon::drop_client(int fd) {
    loop_.unwatch(fd);
    if (clients_.erase(fd) > 0) {
        close(fd);
    }
}

void Daemon::handle_command(int fd, const std::string& json_line) {
    unsigned long id = clients_[fd].id;
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            json data;
            data["pid"] = static_cast<int>(getpid());
            data["processes"] = registry_->size();
            data["shutting_down"] = shutting_down_;
            respond(fd, {{"ok", true}, {"data", data}});
            return;
        }

        if (cmd == "list") {
            json arr = json::array();
            for (const auto& info : registry_->list()) {
                arr.push_back(info_to_json(info));
            }
            respond(fd, {{"ok", true}, {"data", arr}});
            return;
        }

        if (cmd == "start") {
            if (shutting_down_) {
                respond(fd, {{"ok", false}, {"error", "Daemon is shutting down"}});
                return;
            }
            LaunchParams params;
            params.name = req.value("name", "");
            params.script = req.value("script", "");
            params.cwd = req.value("cwd", "");
            params.log = req.value("log", "");
            params.autorestart = req.value("autorestart", false);
            if (req.contains("args") && req["args"].is_array()) {
                params.args = req["args"].get<std::vector<std::string>>();
            }
            if (req.contains("env") && req["env"].is_object()) {
                params.env = req["env"].get<std::map<std::string, std::string>>();
            }

            // Only the first Launch outcome answers this client; relaunches just log
            Callback logger = log_outcome(params.name.empty() ? params.script : params.name);
            auto answered = std::make_shared<bool>(false);
            registry_->start(params, [this, fd, id, answered, logger](const Outcome& outcome) {
                if (outcome.stage == Outcome::Stage::Launch && !*answered) {
                    *answered = true;
                    if (outcome.success) {
                        respond_to(fd, id, {{"ok", true}});
                    } else {
                        respond_to(fd, id, {{"ok", false}, {"error", outcome.error}});
                    }
                    return;
                }
                logger(outcome);
            });
            return;
        }

        if (cmd == "stop") {
            std::string name = req.value("name", "");
            registry_->stop(name, [this, fd, id](const std::string& err) {
                if (err.empty()) {
                    respond_to(fd, id, {{"ok", true}});
                } else {
                    respond_to(fd, id, {{"ok", false}, {"error", err}});
                }
            });
            return;
        }

        if (cmd == "restart") {
            std::string name = req.value("name", "");
            std::size_t matched = registry_->restart(name);
            respond(fd, {{"ok", true}, {"data", {{"matched", matched}}}});
            return;
        }

        if (cmd == "stop_all") {
            registry_->stop_all();
            respond(fd, {{"ok", true}});
            return;
        }

        respond(fd, {{"ok", false}, {"error", "Unknown command: " + cmd}});

    } catch (const json::exception& e) {
        respond(fd, {{"ok", false}, {"error", std::string("Parse error: ") + e.what()}});
    }
}

void Daemon::start_configured_processes() {
    for (const auto& params : config_.data().processes) {
        registry_->start(params, log_outcome(params.name.empty() ? params.script : params.name));
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
    loop_.wakeup();
}

void Daemon::begin_shutdown() {
    shutting_down_ = true;
    registry_->run_stopping_hook();
    registry_->stop_all();
    wait_for_drain(config_.data().stop_timeout_ms + 1000);
}

void Daemon::wait_for_drain(int remaining_ms) {
    if (registry_->size() == 0 || remaining_ms <= 0) {
        loop_.stop();
        return;
    }
    loop_.add_timer(50, [this, remaining_ms]() { wait_for_drain(remaining_ms - 50); });
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        report(default_diagnostics(), "Cannot listen on " + config_.socket_path());
        return 1;
    }

    // 2. Signals and shutdown hook
    loop_.on_signal(SIGTERM, [this](int) { request_stop(); });
    loop_.on_signal(SIGINT, [this](int) { request_stop(); });
    registry_->on_stopping([this]() {
        report(default_diagnostics(),
               "shutting down, stopping " + std::to_string(registry_->size()) + " process(es)");
    });

    // 3. Configured processes
    start_configured_processes();

    // 4. Event loop
    while (!loop_.stopping()) {
        loop_.run_once(-1);
        if (stop_flag_.load() && !shutting_down_) {
            begin_shutdown();
        }
    }

    // 5. Cleanup
    loop_.clear_signal(SIGTERM);
    loop_.clear_signal(SIGINT);
    cleanup_socket();

    return 0;
}

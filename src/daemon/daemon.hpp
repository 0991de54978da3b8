#pragma once

#include "core/config.hpp"
#include "core/event_loop.hpp"
#include "supervisor/registry.hpp"

#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <string>

class Daemon {
public:
    explicit Daemon(Config& config);
    ~Daemon();

    /// Main loop; blocks until stop is requested and children are gone
    int run();

    /// Request graceful stop (safe from any thread)
    void request_stop();

    Registry& registry() { return *registry_; }

private:
    struct Client {
        unsigned long id = 0;
        std::string buffer;
        bool answered = false;
    };

    Config& config_;
    EventLoop loop_;
    std::unique_ptr<Registry> registry_;
    std::atomic<bool> stop_flag_{false};
    bool shutting_down_ = false;
    int socket_fd_ = -1;
    std::map<int, Client> clients_;
    unsigned long next_client_id_ = 1;

    // IPC
    bool start_ipc_server();
    void on_accept();
    void on_client_readable(int fd);
    void handle_command(int fd, const std::string& json_line);
    void respond(int fd, const nlohmann::json& response);
    /// For late answers: the fd may have been recycled by another client
    void respond_to(int fd, unsigned long id, const nlohmann::json& response);
    void drop_client(int fd);
    void cleanup_socket();

    // Lifecycle
    void start_configured_processes();
    void begin_shutdown();
    void wait_for_drain(int remaining_ms);
};

#include <gtest/gtest.h>
#include "daemon/daemon.hpp"
#include "daemon/ipc_client.hpp"
#include "core/cli.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <thread>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;
using json = nlohmann::json;

class DaemonIPCTest : public ::testing::Test {
protected:
    std::string temp_dir_;
    Config config_;

    void SetUp() override {
        temp_dir_ = "/tmp/mpm_d_" + std::to_string(::getpid());
        fs::create_directories(temp_dir_);

        config_.data().socket_path = socket_path();
        config_.data().node_binary = "/bin/sh";
        config_.data().python_binary = "/bin/sh";
        config_.data().stop_timeout_ms = 1000;
        config_.data().restart_delay_ms = 100;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    std::string socket_path() {
        return temp_dir_ + "/minipm.sock";
    }

    std::string write_script(const std::string& name, const std::string& body) {
        std::string path = temp_dir_ + "/" + name;
        std::ofstream f(path);
        f << body << "\n";
        return path;
    }

    bool wait_for_socket(int timeout_ms = 5000) {
        int waited = 0;
        while (waited < timeout_ms) {
            if (fs::exists(socket_path())) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            waited += 50;
        }
        return false;
    }

    json send_ipc(const std::string& line) {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0) return json();

        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::string path = socket_path();
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

        if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(fd);
            return json();
        }

        // Set read timeout
        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string msg = line + "\n";
        if (write(fd, msg.data(), msg.size()) != static_cast<ssize_t>(msg.size())) {
            close(fd);
            return json();
        }

        // Read response
        std::string buf;
        char c;
        while (read(fd, &c, 1) == 1) {
            if (c == '\n') break;
            buf += c;
        }
        close(fd);

        if (buf.empty()) return json();
        json resp = json::parse(buf, nullptr, false);
        return resp.is_discarded() ? json() : resp;
    }

    json send_ipc(const json& cmd) {
        return send_ipc(cmd.dump());
    }
};

TEST_F(DaemonIPCTest, StatusCommand) {
    Daemon daemon(config_);

    // Run daemon in a thread
    std::thread t([&]() { daemon.run(); });

    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc(json{{"cmd", "status"}});
    EXPECT_FALSE(resp.empty());
    if (!resp.empty()) {
        EXPECT_TRUE(resp.value("ok", false));
        ASSERT_TRUE(resp.contains("data"));
        EXPECT_EQ(resp["data"].value("pid", -1), static_cast<int>(getpid()));
        EXPECT_EQ(resp["data"].value("processes", 99), 0);
        EXPECT_FALSE(resp["data"].value("shutting_down", true));
    }

    daemon.request_stop();
    t.join();
    EXPECT_FALSE(fs::exists(socket_path()));
}

TEST_F(DaemonIPCTest, UnknownAndMalformedRequests) {
    Daemon daemon(config_);
    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc(json{{"cmd", "dance"}});
    ASSERT_TRUE(resp.is_object());
    EXPECT_FALSE(resp.value("ok", true));
    EXPECT_EQ(resp.value("error", ""), "Unknown command: dance");

    resp = send_ipc(std::string("{not json"));
    ASSERT_TRUE(resp.is_object());
    EXPECT_FALSE(resp.value("ok", true));
    EXPECT_NE(resp.value("error", "").find("Parse error"), std::string::npos);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, ClientStartListStop) {
    Daemon daemon(config_);
    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    DaemonClient client(socket_path());
    EXPECT_TRUE(client.is_daemon_running());

    LaunchParams params;
    params.name = "sleeper";
    params.script = write_script("sleeper.js", "exec sleep 30");
    std::string err;
    ASSERT_TRUE(client.start(params, err)) << err;

    auto processes = client.list();
    ASSERT_EQ(processes.size(), 1u);
    EXPECT_EQ(processes[0].name, "sleeper");
    EXPECT_EQ(processes[0].family, "node");
    EXPECT_GT(processes[0].pid, 0);

    // stop answers only once the process has ended
    ASSERT_TRUE(client.stop("sleeper", err)) << err;
    EXPECT_TRUE(client.list().empty());

    EXPECT_FALSE(client.stop("sleeper", err));
    EXPECT_EQ(err, "No process named sleeper");

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, RelativePathsResolveAgainstClientDirectory) {
    Daemon daemon(config_);
    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    write_script("rel.py", "echo relative-ok; exec sleep 30");

    // Relative to the directory the command was typed in, not the daemon's
    fs::path original = fs::current_path();
    fs::current_path(temp_dir_);
    LaunchParams params;
    params.name = "rel";
    params.script = "rel.py";
    params.log = "rel.log";
    CLI::resolve_paths(params);
    fs::current_path(original);

    DaemonClient client(socket_path());
    std::string err;
    ASSERT_TRUE(client.start(params, err)) << err;

    auto processes = client.list();
    ASSERT_EQ(processes.size(), 1u);
    EXPECT_EQ(fs::path(processes[0].script).filename().string(), "rel.py");
    EXPECT_TRUE(fs::path(processes[0].script).is_absolute());

    std::string log_path = temp_dir_ + "/rel.log";
    std::string contents;
    for (int i = 0; i < 100 && contents.find("relative-ok") == std::string::npos; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::ifstream f(log_path);
        contents.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
    EXPECT_NE(contents.find("relative-ok"), std::string::npos);

    ASSERT_TRUE(client.stop("rel", err)) << err;
    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, ClientStartReportsConfigurationError) {
    Daemon daemon(config_);
    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    DaemonClient client(socket_path());
    LaunchParams params;
    params.name = "ruby";
    params.script = "./app.rb";
    std::string err;
    EXPECT_FALSE(client.start(params, err));
    EXPECT_EQ(err, "Don't know how to start ./app.rb");
    EXPECT_EQ(client.get_status().processes, 0u);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, ClientRestartCountsMatches) {
    Daemon daemon(config_);
    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    DaemonClient client(socket_path());
    LaunchParams params;
    params.name = "pair";
    params.script = write_script("pair.py", "exec sleep 30");
    std::string err;
    ASSERT_TRUE(client.start(params, err)) << err;
    ASSERT_TRUE(client.start(params, err)) << err;

    std::size_t matched = 0;
    ASSERT_TRUE(client.restart("pair", matched, err)) << err;
    EXPECT_EQ(matched, 2u);

    ASSERT_TRUE(client.restart("nobody", matched, err)) << err;
    EXPECT_EQ(matched, 0u);

    ASSERT_TRUE(client.stop_all(err)) << err;

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, ConfiguredProcessesStartWithDaemon) {
    LaunchParams params;
    params.name = "boot";
    params.script = write_script("boot.py", "exec sleep 30");
    config_.data().processes.push_back(params);

    Daemon daemon(config_);
    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    DaemonClient client(socket_path());
    auto status = client.get_status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.processes, 1u);

    // Shutdown stops the children before run() returns
    daemon.request_stop();
    t.join();
    EXPECT_EQ(daemon.registry().size(), 0u);
}

TEST(DaemonClientTest, NoDaemonRunning) {
    DaemonClient client("/tmp/mpm_no_such_daemon.sock");
    EXPECT_FALSE(client.is_daemon_running());
    EXPECT_FALSE(client.get_status().running);
    EXPECT_TRUE(client.list().empty());

    std::string err;
    EXPECT_FALSE(client.stop("x", err));
    EXPECT_FALSE(err.empty());
}

#include <gtest/gtest.h>
#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;

    void SetUp() override {
        // Create a temp directory for test config
        test_dir = (fs::temp_directory_path() / ("minipm-test-config-" + std::to_string(::getpid()))).string();
        fs::create_directories(test_dir);

        // Save and override HOME
        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        // Restore HOME
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        // Cleanup
        fs::remove_all(test_dir);
    }

    std::string file(const std::string& name) const {
        return test_dir + "/" + name;
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    EXPECT_EQ(cfg.data().node_binary, "node");
    EXPECT_EQ(cfg.data().python_binary, "python");
    EXPECT_EQ(cfg.data().stop_timeout_ms, 5000);
    EXPECT_EQ(cfg.data().restart_delay_ms, 3000);
    EXPECT_EQ(cfg.data().socket_path, "");
    EXPECT_TRUE(cfg.data().processes.empty());
}

TEST_F(ConfigTest, ConfigDirPath) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    std::string dir = Config::config_dir();
    EXPECT_FALSE(dir.empty());
    EXPECT_NE(dir.find(".config/minipm"), std::string::npos);
}

TEST_F(ConfigTest, ConfigFilePath) {
    std::string path = Config::config_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigTest, DefaultSocketLivesInConfigDir) {
    Config cfg;
    EXPECT_EQ(cfg.socket_path(), Config::config_dir() + "/minipm.sock");

    cfg.data().socket_path = "~/run/pm.sock";
    EXPECT_EQ(cfg.socket_path(), test_dir + "/run/pm.sock");
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/logs/app.log"), test_dir + "/logs/app.log");
    EXPECT_EQ(Config::expand_home("/var/log/app.log"), "/var/log/app.log");
    EXPECT_EQ(Config::expand_home(""), "");
}

TEST_F(ConfigTest, LoadNonExistentReturnsFalse) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    Config cfg;
    EXPECT_FALSE(cfg.load());
}

TEST_F(ConfigTest, SaveAndLoad) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    // Save
    Config cfg1;
    cfg1.data().node_binary = "/opt/node/bin/node";
    cfg1.data().python_binary = "python3";
    cfg1.data().stop_timeout_ms = 1500;
    cfg1.data().restart_delay_ms = 250;

    LaunchParams web;
    web.name = "web";
    web.script = "/srv/web/server.js";
    web.args = {"--port", "8080"};
    web.env = {{"NODE_ENV", "production"}};
    web.autorestart = true;
    cfg1.data().processes.push_back(web);

    LaunchParams worker;
    worker.name = "worker";
    worker.cwd = "/srv/worker";
    worker.log = "/var/log/worker.log";
    cfg1.data().processes.push_back(worker);

    ASSERT_TRUE(cfg1.save());

    // Verify file exists
    EXPECT_TRUE(fs::exists(Config::config_path()));

    // Load into new instance
    Config cfg2;
    ASSERT_TRUE(cfg2.load());
    EXPECT_EQ(cfg2.data().node_binary, "/opt/node/bin/node");
    EXPECT_EQ(cfg2.data().python_binary, "python3");
    EXPECT_EQ(cfg2.data().stop_timeout_ms, 1500);
    EXPECT_EQ(cfg2.data().restart_delay_ms, 250);

    ASSERT_EQ(cfg2.data().processes.size(), 2u);
    const auto& p0 = cfg2.data().processes[0];
    EXPECT_EQ(p0.name, "web");
    EXPECT_EQ(p0.script, "/srv/web/server.js");
    ASSERT_EQ(p0.args.size(), 2u);
    EXPECT_EQ(p0.args[1], "8080");
    EXPECT_EQ(p0.env.at("NODE_ENV"), "production");
    EXPECT_TRUE(p0.autorestart);

    const auto& p1 = cfg2.data().processes[1];
    EXPECT_EQ(p1.name, "worker");
    EXPECT_EQ(p1.script, "");
    EXPECT_EQ(p1.cwd, "/srv/worker");
    EXPECT_EQ(p1.log, "/var/log/worker.log");
    EXPECT_FALSE(p1.autorestart);
}

TEST_F(ConfigTest, SaveCreatesDirectory) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    // Remove config dir if it exists
    fs::remove_all(Config::config_dir());
    EXPECT_FALSE(fs::exists(Config::config_dir()));

    Config cfg;
    ASSERT_TRUE(cfg.save());
    EXPECT_TRUE(fs::exists(Config::config_dir()));
}

TEST_F(ConfigTest, LoadFromExplicitPath) {
    std::ofstream out(file("custom.yaml"));
    out << "interpreters:\n"
           "  python: /usr/bin/python3\n"
           "supervisor:\n"
           "  stop_timeout_ms: 900\n"
           "  socket_path: /tmp/minipm-custom.sock\n"
           "processes:\n"
           "  - name: job\n"
           "    script: ~/jobs/job.py\n"
           "    env:\n"
           "      LEVEL: debug\n";
    out.close();

    Config cfg;
    ASSERT_TRUE(cfg.load_from(file("custom.yaml")));
    EXPECT_EQ(cfg.data().node_binary, "node");  // untouched default
    EXPECT_EQ(cfg.data().python_binary, "/usr/bin/python3");
    EXPECT_EQ(cfg.data().stop_timeout_ms, 900);
    EXPECT_EQ(cfg.data().restart_delay_ms, 3000);
    EXPECT_EQ(cfg.socket_path(), "/tmp/minipm-custom.sock");

    ASSERT_EQ(cfg.data().processes.size(), 1u);
    EXPECT_EQ(cfg.data().processes[0].script, test_dir + "/jobs/job.py");
    EXPECT_EQ(cfg.data().processes[0].env.at("LEVEL"), "debug");
}

TEST_F(ConfigTest, SaveToExplicitPathRoundTrips) {
    Config cfg1;
    cfg1.data().socket_path = "/tmp/x.sock";
    ASSERT_TRUE(cfg1.save_to(file("out.yaml")));

    Config cfg2;
    ASSERT_TRUE(cfg2.load_from(file("out.yaml")));
    EXPECT_EQ(cfg2.data().socket_path, "/tmp/x.sock");
    EXPECT_TRUE(cfg2.data().processes.empty());
}

TEST_F(ConfigTest, LoadMalformedYamlUsesDefaults) {
    // Write invalid YAML
    std::ofstream out(file("broken.yaml"));
    out << "{{{{invalid yaml!!!!";
    out.close();

    Config cfg;
    EXPECT_FALSE(cfg.load_from(file("broken.yaml")));
    // Should still have defaults
    EXPECT_EQ(cfg.data().node_binary, "node");
    EXPECT_EQ(cfg.data().stop_timeout_ms, 5000);
}

TEST_F(ConfigTest, BadProcessEntryLeavesConfigUntouched) {
    std::ofstream out(file("half.yaml"));
    out << "interpreters:\n"
           "  node: /opt/node/bin/node\n"
           "processes:\n"
           "  - name: fine\n"
           "    script: /srv/fine.js\n"
           "  - name: bad\n"
           "    script: /srv/bad.js\n"
           "    args:\n"
           "      - {nested: map}\n";
    out.close();

    Config cfg;
    LaunchParams kept;
    kept.name = "kept";
    kept.script = "/srv/kept.py";
    cfg.data().processes.push_back(kept);

    EXPECT_FALSE(cfg.load_from(file("half.yaml")));
    EXPECT_EQ(cfg.data().node_binary, "node");
    ASSERT_EQ(cfg.data().processes.size(), 1u);
    EXPECT_EQ(cfg.data().processes[0].name, "kept");
}

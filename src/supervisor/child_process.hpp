#pragma once

#include <map>
#include <string>
#include <vector>
#include <sys/types.h>

/// Everything needed to fork/exec one child
struct SpawnOptions {
    std::string executable;            // looked up in PATH when it has no '/'
    std::vector<std::string> args;     // argv[1..]
    std::string cwd;                   // empty = inherit
    std::map<std::string, std::string> env;

    bool capture_output = true;        // pipe stdout/stderr back to us
    bool detached = false;             // new session; the supervisor never sets this
    bool open_channel = false;         // socketpair mapped to fd 3 in the child
    std::string channel_env;           // variable announcing the channel fd, e.g. NODE_CHANNEL_FD
};

/// Owning handle for a forked child and the parent ends of its pipes.
/// All fds are non-blocking and close-on-exec.
class ChildProcess {
public:
    /// Exec-status values returned by read_exec_status()
    static constexpr int kExecPending = -1;
    static constexpr int kExecOk = 0;

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Fork and exec. Returns false (with err) only when the fork itself
    /// could not happen; exec failures surface through read_exec_status().
    bool spawn(const SpawnOptions& opts, std::string& err);

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    int channel_fd() const { return channel_fd_; }
    int exec_status_fd() const { return exec_status_fd_; }

    void close_stdout();
    void close_stderr();
    void close_channel();
    void close_exec_status();

    /// Non-blocking. kExecOk once exec succeeded, kExecPending while unknown,
    /// otherwise the errno the child hit (err describes it).
    int read_exec_status(std::string& err);

    /// Send signo unless the child has already been reaped
    bool kill(int signo);

    /// waitpid(WNOHANG). True once reaped; exit_code is -1 for a signal death.
    bool try_reap(int& exit_code, int& signal);

    /// Blocking reap, used when the handle is discarded with a live child
    void reap_blocking();

    /// Write a whole buffer to the channel without raising SIGPIPE
    bool send_on_channel(const std::string& data, std::string& err);

private:
    pid_t pid_ = -1;
    bool reaped_ = false;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int channel_fd_ = -1;
    int exec_status_fd_ = -1;
    std::string executable_;
    std::string cwd_;

    static void close_fd(int& fd);
};

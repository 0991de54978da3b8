#include "supervisor/child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace {

// What the child reports on the exec-status pipe before giving up
struct ExecFailure {
    int stage;  // 1 = chdir, 2 = exec
    int error;
};

struct Pipe {
    int read_end = -1;
    int write_end = -1;

    bool open() {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) return false;
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    void close_both() {
        if (read_end >= 0) close(read_end);
        if (write_end >= 0) close(write_end);
        read_end = write_end = -1;
    }
};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Only async-signal-safe calls from here until exec
[[noreturn]] void exec_child(const SpawnOptions& opts,
                             const std::vector<char*>& argv,
                             const std::vector<char*>& envp,
                             int status_fd, int stdout_fd, int stderr_fd, int channel_fd) {
    if (opts.detached) {
        setsid();
    }

    // Keep the fds we still need clear of 0..3 before dup2 shuffles them
    status_fd = fcntl(status_fd, F_DUPFD_CLOEXEC, 10);
    if (channel_fd >= 0) channel_fd = fcntl(channel_fd, F_DUPFD_CLOEXEC, 10);
    if (stdout_fd >= 0) stdout_fd = fcntl(stdout_fd, F_DUPFD_CLOEXEC, 10);
    if (stderr_fd >= 0) stderr_fd = fcntl(stderr_fd, F_DUPFD_CLOEXEC, 10);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, 0);
        if (devnull != 0) close(devnull);
    }
    if (stdout_fd >= 0) dup2(stdout_fd, 1);
    if (stderr_fd >= 0) dup2(stderr_fd, 2);
    if (channel_fd >= 0) dup2(channel_fd, 3);

    ExecFailure failure{0, 0};
    if (!opts.cwd.empty() && chdir(opts.cwd.c_str()) != 0) {
        failure = ExecFailure{1, errno};
    } else {
        execvpe(argv[0], argv.data(), envp.data());
        failure = ExecFailure{2, errno};
    }

    ssize_t n = write(status_fd, &failure, sizeof(failure));
    (void)n;
    _exit(127);
}

} // namespace

ChildProcess::~ChildProcess() {
    close_stdout();
    close_stderr();
    close_channel();
    close_exec_status();
}

void ChildProcess::close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void ChildProcess::close_stdout() { close_fd(stdout_fd_); }
void ChildProcess::close_stderr() { close_fd(stderr_fd_); }
void ChildProcess::close_channel() { close_fd(channel_fd_); }
void ChildProcess::close_exec_status() { close_fd(exec_status_fd_); }

bool ChildProcess::spawn(const SpawnOptions& opts, std::string& err) {
    if (pid_ > 0) {
        err = "Process already spawned";
        return false;
    }
    if (opts.executable.empty()) {
        err = "No executable given";
        return false;
    }

    executable_ = opts.executable;
    cwd_ = opts.cwd;

    // Build argv/envp before forking; the child must not allocate
    std::vector<std::string> env_strings;
    std::map<std::string, std::string> overlay = opts.env;
    if (opts.open_channel && !opts.channel_env.empty()) {
        overlay[opts.channel_env] = "3";
    }
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        if (overlay.count(key)) continue;
        env_strings.push_back(std::move(entry));
    }
    for (const auto& kv : overlay) {
        env_strings.push_back(kv.first + "=" + kv.second);
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(opts.executable.c_str()));
    for (const auto& arg : opts.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    Pipe status_pipe, out_pipe, err_pipe;
    int channel[2] = {-1, -1};
    bool ok = status_pipe.open();
    if (ok && opts.capture_output) {
        ok = out_pipe.open() && err_pipe.open();
    }
    if (ok && opts.open_channel) {
        ok = socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) == 0;
    }
    if (!ok) {
        err = std::string("Failed to create pipes: ") + std::strerror(errno);
        status_pipe.close_both();
        out_pipe.close_both();
        err_pipe.close_both();
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        err = std::string("fork failed: ") + std::strerror(errno);
        status_pipe.close_both();
        out_pipe.close_both();
        err_pipe.close_both();
        if (channel[0] >= 0) { close(channel[0]); close(channel[1]); }
        return false;
    }

    if (pid == 0) {
        exec_child(opts, argv, envp, status_pipe.write_end,
                   out_pipe.write_end, err_pipe.write_end, channel[1]);
    }

    // Parent keeps the read ends
    pid_ = pid;
    close(status_pipe.write_end);
    exec_status_fd_ = status_pipe.read_end;
    set_nonblocking(exec_status_fd_);

    if (opts.capture_output) {
        close(out_pipe.write_end);
        close(err_pipe.write_end);
        stdout_fd_ = out_pipe.read_end;
        stderr_fd_ = err_pipe.read_end;
        set_nonblocking(stdout_fd_);
        set_nonblocking(stderr_fd_);
    }
    if (opts.open_channel) {
        close(channel[1]);
        channel_fd_ = channel[0];
        set_nonblocking(channel_fd_);
    }
    return true;
}

int ChildProcess::read_exec_status(std::string& err) {
    if (exec_status_fd_ < 0) return kExecOk;

    ExecFailure failure{0, 0};
    ssize_t n = read(exec_status_fd_, &failure, sizeof(failure));
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
        return kExecPending;
    }
    close_exec_status();

    // EOF: the close-on-exec end vanished, so exec went through
    if (n <= 0) return kExecOk;

    if (n != static_cast<ssize_t>(sizeof(failure)) || failure.error == 0) {
        err = "Failed to start " + executable_;
        return EIO;
    }
    if (failure.stage == 1) {
        err = "Cannot change directory to " + cwd_ + ": " + std::strerror(failure.error);
    } else {
        err = "Failed to start " + executable_ + ": " + std::strerror(failure.error);
    }
    return failure.error;
}

bool ChildProcess::kill(int signo) {
    if (pid_ <= 0 || reaped_) return false;
    return ::kill(pid_, signo) == 0;
}

bool ChildProcess::try_reap(int& exit_code, int& signal) {
    if (pid_ <= 0) return false;
    if (reaped_) return true;

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result != pid_) return false;

    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
        signal = 0;
    } else {
        exit_code = -1;
        signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
    }
    return true;
}

void ChildProcess::reap_blocking() {
    if (pid_ <= 0 || reaped_) return;
    int status = 0;
    while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    reaped_ = true;
}

bool ChildProcess::send_on_channel(const std::string& data, std::string& err) {
    if (channel_fd_ < 0) {
        err = "No channel to child";
        return false;
    }
    std::size_t total = 0;
    while (total < data.size()) {
        ssize_t n = send(channel_fd_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            err = std::string("Channel write failed: ") + std::strerror(errno);
            return false;
        }
        total += static_cast<std::size_t>(n);
    }
    return true;
}

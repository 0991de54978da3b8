#include "supervisor/process_entry.hpp"

#include <nlohmann/json.hpp>
#include <signal.h>
#include <unistd.h>
#include <cerrno>

using json = nlohmann::json;

ProcessEntry::ProcessEntry(EventLoop& loop, LaunchParams params, std::string script,
                           Callback callback, Diagnostics diag,
                           std::ostream& out, std::ostream& err)
    : loop_(loop),
      params_(std::move(params)),
      script_(std::move(script)),
      callback_(std::move(callback)),
      diag_(diag),
      capture_(OutputSink(params_.log, diag, out, err)),
      reconciler_([this]() { capture_.flush(); },
                  [this](const Outcome& outcome) { on_resolved(outcome); }) {}

ProcessEntry::~ProcessEntry() {
    if (kill_timer_) loop_.cancel_timer(kill_timer_);
    loop_.unwatch(child_.exec_status_fd());
    loop_.unwatch(child_.stdout_fd());
    loop_.unwatch(child_.stderr_fd());
    loop_.unwatch(child_.channel_fd());

    // Never leave a zombie behind
    if (child_.pid() > 0 && !child_.reaped()) {
        child_.kill(SIGKILL);
        child_.reap_blocking();
    }
}

const char* ProcessEntry::state_name(State state) {
    switch (state) {
        case State::Launching: return "launching";
        case State::Running: return "running";
        case State::Terminated: return "terminated";
    }
    return "unknown";
}

bool ProcessEntry::launch(const LaunchStrategy& strategy, std::string& err) {
    family_ = strategy.family();
    SpawnOptions opts = strategy.prepare(params_, script_);
    if (!child_.spawn(opts, err)) {
        return false;
    }

    state_ = State::Launching;
    loop_.watch(child_.exec_status_fd(), [this]() { on_exec_status(); });
    loop_.watch(child_.stdout_fd(), [this]() { drain(false); });
    loop_.watch(child_.stderr_fd(), [this]() { drain(true); });
    loop_.watch(child_.channel_fd(), [this]() { on_channel(); });
    return true;
}

void ProcessEntry::on_exec_status() {
    int fd = child_.exec_status_fd();
    if (fd < 0) return;

    std::string err;
    int status = child_.read_exec_status(err);
    if (status == ChildProcess::kExecPending) return;
    loop_.unwatch(fd);

    if (status == ChildProcess::kExecOk) {
        if (state_ == State::Launching) state_ = State::Running;
        return;
    }

    // Launch fault: nothing more will come out of this child
    close_stream(false);
    close_stream(true);
    close_channel();
    reconciler_.on_error(err);
}

void ProcessEntry::drain(bool is_error) {
    int fd = is_error ? child_.stderr_fd() : child_.stdout_fd();
    if (fd < 0) return;

    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (is_error) {
                capture_.on_stderr(buf, static_cast<std::size_t>(n));
            } else {
                capture_.on_stdout(buf, static_cast<std::size_t>(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        break;  // EOF or a read error: the stream is finished either way
    }

    close_stream(is_error);
    if (exit_seen_ && streams_closed()) {
        reconciler_.on_close(exit_code_, signal_);
    }
}

void ProcessEntry::on_channel() {
    int fd = child_.channel_fd();
    if (fd < 0) return;

    // Messages from the child are not interpreted; only watch for hangup
    char buf[1024];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) continue;
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        break;
    }
    close_channel();
}

void ProcessEntry::close_stream(bool is_error) {
    int fd = is_error ? child_.stderr_fd() : child_.stdout_fd();
    if (fd < 0) return;
    loop_.unwatch(fd);
    if (is_error) {
        child_.close_stderr();
    } else {
        child_.close_stdout();
    }
}

void ProcessEntry::close_channel() {
    loop_.unwatch(child_.channel_fd());
    child_.close_channel();
}

bool ProcessEntry::streams_closed() const {
    return child_.stdout_fd() < 0 && child_.stderr_fd() < 0;
}

void ProcessEntry::on_child_signal() {
    if (child_.pid() <= 0 || child_.reaped()) return;

    int code = -1;
    int sig = 0;
    if (!child_.try_reap(code, sig)) return;

    exit_code_ = code;
    signal_ = sig;
    state_ = State::Terminated;
    if (kill_timer_) {
        loop_.cancel_timer(kill_timer_);
        kill_timer_ = 0;
    }

    // A failed exec also ends in _exit; let the status pipe speak first
    on_exec_status();

    // Take whatever the child wrote before it died
    drain(false);
    drain(true);
    close_channel();

    exit_seen_ = true;
    reconciler_.on_exit(code, sig);
    if (streams_closed()) {
        reconciler_.on_close(code, sig);
    }
}

bool ProcessEntry::notify_shutdown() {
    if (child_.channel_fd() < 0) return false;

    std::string err;
    std::string message = json({{"cmd", "shutdown"}}).dump() + "\n";
    if (!child_.send_on_channel(message, err)) {
        report(diag_, "Cannot notify " + (name().empty() ? script_ : name()) + ": " + err);
        return false;
    }
    return true;
}

void ProcessEntry::request_stop(int grace_ms) {
    stop_requested_ = true;
    reconciler_.mark_stopping();
    if (child_.reaped() || child_.pid() <= 0) return;

    notify_shutdown();
    child_.kill(SIGTERM);

    if (kill_timer_ == 0) {
        kill_timer_ = loop_.add_timer(grace_ms, [this]() {
            kill_timer_ = 0;
            child_.kill(SIGKILL);
        });
    }
}

void ProcessEntry::on_resolved(const Outcome& outcome) {
    if (callback_) callback_(outcome);
    if (resolved_hook_) resolved_hook_(*this, outcome);
}

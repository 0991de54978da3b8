#include "core/event_loop.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

// Write end of the self-pipe of the loop that owns signal delivery
static volatile sig_atomic_t g_signal_fd = -1;

// Set by the trampoline, cleared when the handler runs. The pipe byte only
// wakes the loop; it may be dropped when the pipe is already full.
static volatile sig_atomic_t g_pending[NSIG];

static void signal_trampoline(int signo) {
    int saved_errno = errno;
    if (signo > 0 && signo < NSIG) g_pending[signo] = 1;
    if (g_signal_fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(signo);
        ssize_t n = write(g_signal_fd, &byte, 1);
        (void)n;  // a full pipe already guarantees a wakeup
    }
    errno = saved_errno;
}

EventLoop::EventLoop() {
    int fds[2];
    if (pipe2(fds, O_NONBLOCK | O_CLOEXEC) == 0) {
        wake_read_ = fds[0];
        wake_write_ = fds[1];
    }
}

EventLoop::~EventLoop() {
    for (const auto& entry : signal_handlers_) {
        signal(entry.first, SIG_DFL);
    }
    if (g_signal_fd == wake_write_) {
        g_signal_fd = -1;
    }
    if (wake_read_ >= 0) close(wake_read_);
    if (wake_write_ >= 0) close(wake_write_);
}

void EventLoop::watch(int fd, Handler on_readable) {
    if (fd < 0) return;
    watches_[fd] = std::move(on_readable);
}

void EventLoop::unwatch(int fd) {
    watches_.erase(fd);
}

bool EventLoop::watching(int fd) const {
    return watches_.count(fd) > 0;
}

EventLoop::TimerId EventLoop::add_timer(int delay_ms, Handler handler) {
    TimerId id = next_timer_id_++;
    timers_[id] = Timer{Clock::now() + std::chrono::milliseconds(delay_ms), std::move(handler)};
    return id;
}

void EventLoop::cancel_timer(TimerId id) {
    timers_.erase(id);
}

EventLoop::TimerId EventLoop::post(Handler handler) {
    return add_timer(0, std::move(handler));
}

void EventLoop::on_signal(int signo, SignalHandler handler) {
    signal_handlers_[signo] = std::move(handler);
    g_signal_fd = wake_write_;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_trampoline;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (signo == SIGCHLD) sa.sa_flags |= SA_NOCLDSTOP;
    sigaction(signo, &sa, nullptr);
}

void EventLoop::clear_signal(int signo) {
    if (signal_handlers_.erase(signo) > 0) {
        signal(signo, SIG_DFL);
    }
}

int EventLoop::run() {
    while (!stop_requested_.load()) {
        run_once(-1);
    }
    return 0;
}

void EventLoop::stop() {
    stop_requested_.store(true);
    wakeup();
}

bool EventLoop::stopping() const {
    return stop_requested_.load();
}

void EventLoop::wakeup() {
    if (wake_write_ < 0) return;
    unsigned char byte = 0;
    ssize_t n = write(wake_write_, &byte, 1);
    (void)n;
}

int EventLoop::next_timeout(int timeout_ms) const {
    if (timers_.empty()) return timeout_ms;

    auto now = Clock::now();
    auto earliest = timers_.begin()->second.deadline;
    for (const auto& entry : timers_) {
        if (entry.second.deadline < earliest) earliest = entry.second.deadline;
    }

    long long wait = 0;
    if (earliest > now) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - now);
        wait = remaining.count() + 1;
    }
    if (timeout_ms < 0 || wait < timeout_ms) return static_cast<int>(wait);
    return timeout_ms;
}

void EventLoop::drain_wake_pipe() {
    unsigned char buf[256];
    while (read(wake_read_, buf, sizeof(buf)) > 0) {
    }
}

void EventLoop::dispatch_signals() {
    std::vector<int> signals;
    for (const auto& entry : signal_handlers_) {
        signals.push_back(entry.first);
    }
    for (int signo : signals) {
        if (signo <= 0 || signo >= NSIG || !g_pending[signo]) continue;
        g_pending[signo] = 0;
        // A previous handler may have cleared this one
        auto it = signal_handlers_.find(signo);
        if (it == signal_handlers_.end()) continue;
        SignalHandler handler = it->second;
        handler(signo);
    }
}

bool EventLoop::fire_due_timers() {
    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& entry : timers_) {
        if (entry.second.deadline <= now) due.emplace_back(entry.second.deadline, entry.first);
    }
    std::sort(due.begin(), due.end());
    for (const auto& item : due) {
        TimerId id = item.second;
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;  // cancelled by an earlier timer
        Handler handler = std::move(it->second.handler);
        timers_.erase(it);
        handler();
    }
    return !due.empty();
}

bool EventLoop::run_once(int timeout_ms) {
    std::vector<struct pollfd> fds;
    fds.reserve(watches_.size() + 1);
    if (wake_read_ >= 0) {
        fds.push_back({wake_read_, POLLIN, 0});
    }
    for (const auto& entry : watches_) {
        fds.push_back({entry.first, POLLIN, 0});
    }

    int timeout = next_timeout(timeout_ms);
    int ret = poll(fds.data(), fds.size(), timeout);
    if (ret < 0 && errno != EINTR) {
        return false;
    }
    if (ret < 0) {
        // Interrupted before the pipe byte was seen
        dispatch_signals();
    }

    if (ret > 0) {
        for (const auto& pfd : fds) {
            if (pfd.revents == 0) continue;
            if (pfd.fd == wake_read_) {
                drain_wake_pipe();
                dispatch_signals();
                continue;
            }
            // A previous handler may have removed this watch
            auto it = watches_.find(pfd.fd);
            if (it == watches_.end()) continue;
            Handler handler = it->second;
            handler();
        }
    }

    return fire_due_timers() || ret > 0;
}

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <vector>

/// Single-threaded poll(2) reactor. File-descriptor readiness, timers and
/// POSIX signals are all dispatched on the thread that calls run().
class EventLoop {
public:
    using Handler = std::function<void()>;
    using SignalHandler = std::function<void(int signo)>;
    using TimerId = unsigned long;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Call on_readable whenever fd is readable (or hung up)
    void watch(int fd, Handler on_readable);
    void unwatch(int fd);
    bool watching(int fd) const;

    /// One-shot timer; returns an id usable with cancel_timer
    TimerId add_timer(int delay_ms, Handler handler);
    void cancel_timer(TimerId id);

    /// Run handler on the next loop iteration
    TimerId post(Handler handler);

    /// Route a POSIX signal to handler, on the loop thread
    void on_signal(int signo, SignalHandler handler);
    void clear_signal(int signo);

    /// Block until stop() is called
    int run();

    /// Wait at most timeout_ms (-1 = no limit) and dispatch what is ready.
    /// Returns true when at least one handler ran.
    bool run_once(int timeout_ms);

    /// Thread-safe: ask run() to return
    void stop();
    bool stopping() const;

    /// Thread-safe: interrupt a blocking run_once()
    void wakeup();

private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point deadline;
        Handler handler;
    };

    int wake_read_ = -1;
    int wake_write_ = -1;
    std::atomic<bool> stop_requested_{false};

    std::map<int, Handler> watches_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
    std::map<int, SignalHandler> signal_handlers_;

    int next_timeout(int timeout_ms) const;
    void drain_wake_pipe();
    void dispatch_signals();
    bool fire_due_timers();
};

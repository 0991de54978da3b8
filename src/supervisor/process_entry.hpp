#pragma once

#include "core/diagnostics.hpp"
#include "core/event_loop.hpp"
#include "supervisor/child_process.hpp"
#include "supervisor/exit_reconciler.hpp"
#include "supervisor/launch_params.hpp"
#include "supervisor/launch_strategy.hpp"
#include "supervisor/output_capture.hpp"

#include <functional>
#include <iostream>
#include <string>

/// One supervised launch: parameters, the live child, its output capture
/// and the reconciler that reports its end. Never reused for a relaunch.
class ProcessEntry {
public:
    enum class State { Launching, Running, Terminated };

    using ResolvedHook = std::function<void(ProcessEntry& entry, const Outcome& outcome)>;

    ProcessEntry(EventLoop& loop, LaunchParams params, std::string script,
                 Callback callback, Diagnostics diag = default_diagnostics(),
                 std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~ProcessEntry();

    ProcessEntry(const ProcessEntry&) = delete;
    ProcessEntry& operator=(const ProcessEntry&) = delete;

    /// Spawn through strategy and start watching the child.
    /// False only when nothing could be spawned at all.
    bool launch(const LaunchStrategy& strategy, std::string& err);

    /// SIGCHLD arrived: reap the child if it is ours and finished
    void on_child_signal();

    /// Shutdown notification, SIGTERM, then SIGKILL after grace_ms
    void request_stop(int grace_ms);

    /// Send the shutdown message over the channel, if the family has one
    bool notify_shutdown();

    /// Emit buffered partial lines
    void flush() { capture_.flush(); }

    /// Called once, right after the registrant's callback saw the outcome
    void set_resolved_hook(ResolvedHook hook) { resolved_hook_ = std::move(hook); }

    const std::string& name() const { return params_.name; }
    const LaunchParams& params() const { return params_; }
    const std::string& script() const { return script_; }
    const Callback& callback() const { return callback_; }
    const std::string& family() const { return family_; }
    pid_t pid() const { return child_.pid(); }
    State state() const { return state_; }
    bool stop_requested() const { return stop_requested_; }
    bool resolved() const { return reconciler_.resolved(); }
    const Outcome& outcome() const { return reconciler_.outcome(); }

    static const char* state_name(State state);

private:
    EventLoop& loop_;
    LaunchParams params_;
    std::string script_;
    std::string family_;
    Callback callback_;
    Diagnostics diag_;

    ChildProcess child_;
    OutputCapture capture_;
    ExitReconciler reconciler_;
    ResolvedHook resolved_hook_;

    State state_ = State::Launching;
    bool stop_requested_ = false;
    bool exit_seen_ = false;
    int exit_code_ = -1;
    int signal_ = 0;
    EventLoop::TimerId kill_timer_ = 0;

    void on_exec_status();
    void drain(bool is_error);
    void on_channel();
    void close_stream(bool is_error);
    void close_channel();
    bool streams_closed() const;
    void on_resolved(const Outcome& outcome);
};

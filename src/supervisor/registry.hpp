#pragma once

#include "core/diagnostics.hpp"
#include "core/event_loop.hpp"
#include "supervisor/launch_params.hpp"
#include "supervisor/launch_strategy.hpp"
#include "supervisor/outcome.hpp"
#include "supervisor/process_entry.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <vector>

/// Snapshot of one registry entry, for list/status output
struct ProcessInfo {
    std::string name;
    std::string script;
    std::string family;
    int pid = -1;
    std::string state;
    bool stopping = false;
};

/// The supervisor's set of launched processes, in launch order.
/// Lives on one EventLoop; every method must be called from its thread.
class Registry {
public:
    struct Options {
        int stop_timeout_ms = 5000;   // SIGTERM -> SIGKILL grace period
        int restart_delay_ms = 3000;  // delay before an autorestart relaunch
        std::ostream* out = &std::cout;
        std::ostream* err = &std::cerr;
    };

    using StopCallback = std::function<void(const std::string& err)>;
    using StoppingHook = std::function<void()>;

    Registry(EventLoop& loop, StrategyTable strategies);
    Registry(EventLoop& loop, StrategyTable strategies, Options options,
             Diagnostics diag = default_diagnostics());
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Resolve the script, pick a strategy, spawn and register.
    /// cb first gets a Launch outcome (synchronously), then exactly one
    /// Exit outcome if the launch was accepted. params may be null.
    void start(const LaunchParams* params, Callback cb = {});
    void start(const LaunchParams& params, Callback cb = {});

    /// Stop every entry called name; cb runs once all of them have ended,
    /// or right away with an error when nothing matches
    void stop(const std::string& name, StopCallback cb = {});

    /// Stop and relaunch every entry called name with the same parameters.
    /// Returns how many entries matched.
    std::size_t restart(const std::string& name);

    /// Stop every entry, in launch order
    void stop_all();

    /// Replace the shutdown hook
    void on_stopping(StoppingHook hook);

    /// Run the shutdown hook if one is installed
    bool run_stopping_hook();

    std::size_t size() const { return entries_.size(); }
    std::size_t count(const std::string& name) const;
    std::vector<ProcessInfo> list() const;

    const Options& options() const { return options_; }

private:
    EventLoop& loop_;
    StrategyTable strategies_;
    Options options_;
    Diagnostics diag_;
    StoppingHook stopping_hook_;

    std::vector<std::unique_ptr<ProcessEntry>> entries_;
    // Work to run once an entry's outcome is known, keyed by entry
    std::vector<std::pair<ProcessEntry*, std::function<void()>>> after_resolve_;
    std::set<EventLoop::TimerId> timers_;
    // Entries whose restart has queued a relaunch not yet carried out
    std::set<ProcessEntry*> restart_pending_;

    std::vector<ProcessEntry*> matching(const std::string& name) const;
    void stop_entry(ProcessEntry* entry, std::function<void()> done);
    void when_resolved(ProcessEntry* entry, std::function<void()> fn);
    void on_entry_resolved(ProcessEntry& entry, const Outcome& outcome);
    void remove(ProcessEntry* entry);
    void relaunch(const LaunchParams& params, const std::string& script, const Callback& cb);
    void defer(int delay_ms, std::function<void()> fn);
    void reap_children();
};

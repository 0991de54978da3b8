#include "supervisor/registry.hpp"
#include "supervisor/manifest.hpp"

#include <signal.h>
#include <algorithm>

Registry::Registry(EventLoop& loop, StrategyTable strategies)
    : Registry(loop, std::move(strategies), Options()) {}

Registry::Registry(EventLoop& loop, StrategyTable strategies, Options options, Diagnostics diag)
    : loop_(loop),
      strategies_(std::move(strategies)),
      options_(options),
      diag_(std::move(diag)) {
    loop_.on_signal(SIGCHLD, [this](int) { reap_children(); });
}

Registry::~Registry() {
    for (auto id : timers_) {
        loop_.cancel_timer(id);
    }
    loop_.clear_signal(SIGCHLD);
    // Entry destructors kill and reap whatever is still running
    entries_.clear();
}

void Registry::start(const LaunchParams& params, Callback cb) {
    start(&params, std::move(cb));
}

void Registry::start(const LaunchParams* params, Callback cb) {
    if (!cb) {
        Diagnostics diag = diag_;
        cb = [diag](const Outcome& outcome) {
            if (!outcome.success) report(diag, outcome.error);
        };
    }

    if (!params) {
        cb(Outcome::failed(Outcome::Stage::Launch, "Cannot start process without any information"));
        return;
    }
    if (params->script.empty() && params->cwd.empty()) {
        cb(Outcome::failed(Outcome::Stage::Launch, "Cannot start process without 'script' or 'cwd'"));
        return;
    }

    std::string script = params->script;
    if (script.empty()) {
        script = Manifest::entry_point(params->cwd);
    }
    if (script.empty()) {
        cb(Outcome::failed(Outcome::Stage::Launch, "No script given to run"));
        return;
    }

    const LaunchStrategy* strategy = strategies_.select(script);
    if (!strategy) {
        cb(Outcome::failed(Outcome::Stage::Launch, "Don't know how to start " + script));
        return;
    }

    auto entry = std::make_unique<ProcessEntry>(loop_, *params, script, cb, diag_,
                                                *options_.out, *options_.err);
    entry->set_resolved_hook([this](ProcessEntry& e, const Outcome& outcome) {
        on_entry_resolved(e, outcome);
    });

    std::string err;
    if (!entry->launch(*strategy, err)) {
        cb(Outcome::failed(Outcome::Stage::Launch, err));
        return;
    }

    entries_.push_back(std::move(entry));
    cb(Outcome::launched());
}

std::vector<ProcessEntry*> Registry::matching(const std::string& name) const {
    std::vector<ProcessEntry*> result;
    if (name.empty()) return result;  // unnamed entries are not addressable
    for (const auto& entry : entries_) {
        if (entry->name() == name) result.push_back(entry.get());
    }
    return result;
}

std::size_t Registry::count(const std::string& name) const {
    return matching(name).size();
}

void Registry::stop(const std::string& name, StopCallback cb) {
    auto matches = matching(name);
    if (matches.empty()) {
        if (cb) cb("No process named " + name);
        return;
    }

    auto remaining = std::make_shared<std::size_t>(matches.size());
    for (auto* entry : matches) {
        restart_pending_.erase(entry);
        stop_entry(entry, [remaining, cb]() {
            if (--*remaining == 0 && cb) cb("");
        });
    }
}

std::size_t Registry::restart(const std::string& name) {
    auto matches = matching(name);
    for (auto* entry : matches) {
        // One relaunch per entry, however often restart is asked for
        if (!restart_pending_.insert(entry).second) continue;
        LaunchParams params = entry->params();
        std::string script = entry->script();
        Callback cb = entry->callback();
        stop_entry(entry, [this, entry, params, script, cb]() {
            // A stop issued after the restart cancels the relaunch
            if (restart_pending_.erase(entry) == 0) return;
            relaunch(params, script, cb);
        });
    }
    return matches.size();
}

void Registry::stop_all() {
    std::vector<ProcessEntry*> all;
    for (const auto& entry : entries_) all.push_back(entry.get());
    for (auto* entry : all) {
        restart_pending_.erase(entry);
        stop_entry(entry, {});
    }
}

void Registry::on_stopping(StoppingHook hook) {
    stopping_hook_ = std::move(hook);
}

bool Registry::run_stopping_hook() {
    if (!stopping_hook_) return false;
    StoppingHook hook = stopping_hook_;
    hook();
    return true;
}

std::vector<ProcessInfo> Registry::list() const {
    std::vector<ProcessInfo> result;
    for (const auto& entry : entries_) {
        ProcessInfo info;
        info.name = entry->name();
        info.script = entry->script();
        info.family = entry->family();
        info.pid = entry->pid();
        info.state = ProcessEntry::state_name(entry->state());
        info.stopping = entry->stop_requested();
        result.push_back(std::move(info));
    }
    return result;
}

void Registry::stop_entry(ProcessEntry* entry, std::function<void()> done) {
    bool already_resolved = entry->resolved();
    entry->request_stop(options_.stop_timeout_ms);

    if (already_resolved) {
        defer(0, [this, entry, done]() {
            remove(entry);
            if (done) done();
        });
    } else {
        when_resolved(entry, std::move(done));
    }
}

void Registry::when_resolved(ProcessEntry* entry, std::function<void()> fn) {
    if (!fn) return;
    after_resolve_.emplace_back(entry, std::move(fn));
}

void Registry::on_entry_resolved(ProcessEntry& entry, const Outcome& outcome) {
    ProcessEntry* ptr = &entry;

    std::vector<std::function<void()>> work;
    auto it = after_resolve_.begin();
    while (it != after_resolve_.end()) {
        if (it->first == ptr) {
            work.push_back(std::move(it->second));
            it = after_resolve_.erase(it);
        } else {
            ++it;
        }
    }

    // We are still inside the entry's own call stack: act on the next turn
    if (entry.stop_requested()) {
        defer(0, [this, ptr, work]() {
            remove(ptr);
            for (const auto& fn : work) fn();
        });
        return;
    }

    if (entry.params().autorestart && !outcome.success) {
        LaunchParams params = entry.params();
        std::string script = entry.script();
        Callback cb = entry.callback();
        defer(options_.restart_delay_ms, [this, ptr, params, script, cb]() {
            auto found = std::find_if(entries_.begin(), entries_.end(),
                                      [ptr](const std::unique_ptr<ProcessEntry>& e) { return e.get() == ptr; });
            // Someone stopped it in the meantime
            if (found == entries_.end() || ptr->stop_requested()) return;
            remove(ptr);
            relaunch(params, script, cb);
        });
    }
}

void Registry::remove(ProcessEntry* entry) {
    after_resolve_.erase(
        std::remove_if(after_resolve_.begin(), after_resolve_.end(),
                       [entry](const std::pair<ProcessEntry*, std::function<void()>>& item) {
                           return item.first == entry;
                       }),
        after_resolve_.end());

    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
                       [entry](const std::unique_ptr<ProcessEntry>& e) { return e.get() == entry; }),
        entries_.end());
}

void Registry::relaunch(const LaunchParams& params, const std::string& script, const Callback& cb) {
    LaunchParams next = params;
    next.script = script;
    start(next, cb);
}

void Registry::defer(int delay_ms, std::function<void()> fn) {
    auto id = std::make_shared<EventLoop::TimerId>(0);
    *id = loop_.add_timer(delay_ms, [this, id, fn]() {
        timers_.erase(*id);
        fn();
    });
    timers_.insert(*id);
}

void Registry::reap_children() {
    // Callbacks may start new entries; walk a snapshot
    std::vector<ProcessEntry*> snapshot;
    for (const auto& entry : entries_) snapshot.push_back(entry.get());
    for (auto* entry : snapshot) {
        entry->on_child_signal();
    }
}

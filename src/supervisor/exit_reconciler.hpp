#pragma once

#include "supervisor/outcome.hpp"

#include <functional>
#include <string>

/// Collapses the error / exit / close events of one child into exactly one
/// terminal Outcome. The events may arrive in any order, any number of
/// times, or not at all; only the first one counts.
class ExitReconciler {
public:
    using Flush = std::function<void()>;

    ExitReconciler(Flush flush, Callback on_resolved);

    /// The child could not be started, or faulted at runtime
    void on_error(const std::string& error);

    /// The child ended (exit_code -1 when killed by signal)
    void on_exit(int exit_code, int signal);

    /// The child ended and its output streams are drained
    void on_close(int exit_code, int signal);

    /// A stop was requested: a signal-induced exit is then not a failure
    void mark_stopping() { stopping_ = true; }

    bool resolved() const { return resolved_; }
    const Outcome& outcome() const { return outcome_; }

private:
    Flush flush_;
    Callback on_resolved_;
    bool resolved_ = false;
    bool stopping_ = false;
    Outcome outcome_;

    void resolve(Outcome outcome);
    void on_done(int exit_code, int signal);
};

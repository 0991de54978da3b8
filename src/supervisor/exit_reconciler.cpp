#include "supervisor/exit_reconciler.hpp"

ExitReconciler::ExitReconciler(Flush flush, Callback on_resolved)
    : flush_(std::move(flush)), on_resolved_(std::move(on_resolved)) {}

void ExitReconciler::on_error(const std::string& error) {
    if (resolved_) return;
    resolve(Outcome::failed(Outcome::Stage::Exit, error));
}

void ExitReconciler::on_exit(int exit_code, int signal) {
    on_done(exit_code, signal);
}

void ExitReconciler::on_close(int exit_code, int signal) {
    on_done(exit_code, signal);
}

void ExitReconciler::on_done(int exit_code, int signal) {
    if (resolved_) return;

    Outcome outcome;
    outcome.stage = Outcome::Stage::Exit;
    outcome.exit_code = exit_code;
    outcome.signal = signal;
    outcome.stopped = stopping_;

    bool abnormal = (exit_code != 0) || (signal != 0);
    if (abnormal && !stopping_) {
        outcome.success = false;
        if (signal != 0) {
            outcome.error = "Exited with error (signal " + std::to_string(signal) + ")";
        } else {
            outcome.error = "Exited with error (code " + std::to_string(exit_code) + ")";
        }
    }
    resolve(std::move(outcome));
}

void ExitReconciler::resolve(Outcome outcome) {
    // Flush first so trailing output precedes the terminal callback
    if (flush_) flush_();
    resolved_ = true;
    outcome_ = std::move(outcome);
    if (on_resolved_) on_resolved_(outcome_);
}

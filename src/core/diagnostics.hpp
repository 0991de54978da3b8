#pragma once

#include <functional>
#include <string>

/// Sink for the supervisor's own error messages (log-write faults, IPC trouble).
using Diagnostics = std::function<void(const std::string& message)>;

/// Writes "minipm: <message>" to stderr
Diagnostics default_diagnostics();

/// Report through diag, falling back to stderr when diag is empty
void report(const Diagnostics& diag, const std::string& message);

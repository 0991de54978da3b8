#pragma once

#include "core/diagnostics.hpp"

#include <iostream>
#include <string>

/// Routes finished lines either to an append-only log file or to the
/// supervisor's own stdout/stderr.
class OutputSink {
public:
    /// Empty log_path selects the out/err streams
    explicit OutputSink(std::string log_path,
                        Diagnostics diag = default_diagnostics(),
                        std::ostream& out = std::cout,
                        std::ostream& err = std::cerr);

    /// Never throws; a failed file append is reported through diag
    void write(const std::string& line, bool is_error);

    const std::string& log_path() const { return log_path_; }
    bool to_file() const { return !log_path_.empty(); }

private:
    std::string log_path_;
    Diagnostics diag_;
    std::ostream* out_;
    std::ostream* err_;
};

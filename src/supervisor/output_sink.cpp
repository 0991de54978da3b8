#include "supervisor/output_sink.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

OutputSink::OutputSink(std::string log_path, Diagnostics diag,
                       std::ostream& out, std::ostream& err)
    : log_path_(std::move(log_path)), diag_(std::move(diag)), out_(&out), err_(&err) {}

void OutputSink::write(const std::string& line, bool is_error) {
    if (log_path_.empty()) {
        std::ostream& stream = is_error ? *err_ : *out_;
        stream << line << "\n";
        stream.flush();
        return;
    }

    std::ofstream file(log_path_, std::ios::app);
    if (file.is_open()) {
        file << line << "\n";
        file.flush();
        if (file.good()) return;
    }
    int saved = errno;
    report(diag_, "Failed to write to log file " + log_path_ + ": " +
                  (saved ? std::strerror(saved) : "write error"));
}

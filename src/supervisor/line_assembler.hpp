#pragma once

#include <cstddef>
#include <functional>
#include <string>

/// Turns a stream of raw chunks into newline-delimited lines, keeping the
/// unterminated tail until more data (or flush) arrives.
class LineAssembler {
public:
    using Emit = std::function<void(const std::string& line)>;

    /// Append chunk and emit every line it completes.
    /// Any run of '\n' / '\r' counts as one line break.
    void feed(const char* data, std::size_t len, const Emit& emit);
    void feed(const std::string& chunk, const Emit& emit);

    /// Emit the pending tail (whitespace-trimmed) if it is not blank, then clear it
    void flush(const Emit& emit);

    const std::string& pending() const { return pending_; }

private:
    std::string pending_;
};

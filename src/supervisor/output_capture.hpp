#pragma once

#include "supervisor/line_assembler.hpp"
#include "supervisor/output_sink.hpp"

/// Two line assemblers (stdout, stderr) feeding one sink
class OutputCapture {
public:
    explicit OutputCapture(OutputSink sink);

    void on_stdout(const char* data, std::size_t len);
    void on_stderr(const char* data, std::size_t len);

    /// Emit pending partial lines of both streams. Safe to call repeatedly.
    void flush();

    const OutputSink& sink() const { return sink_; }

private:
    OutputSink sink_;
    LineAssembler out_;
    LineAssembler err_;
};

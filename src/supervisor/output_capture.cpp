#include "supervisor/output_capture.hpp"

OutputCapture::OutputCapture(OutputSink sink) : sink_(std::move(sink)) {}

void OutputCapture::on_stdout(const char* data, std::size_t len) {
    out_.feed(data, len, [this](const std::string& line) { sink_.write(line, false); });
}

void OutputCapture::on_stderr(const char* data, std::size_t len) {
    err_.feed(data, len, [this](const std::string& line) { sink_.write(line, true); });
}

void OutputCapture::flush() {
    out_.flush([this](const std::string& line) { sink_.write(line, false); });
    err_.flush([this](const std::string& line) { sink_.write(line, true); });
}

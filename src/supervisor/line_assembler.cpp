#include "supervisor/line_assembler.hpp"

static bool is_break(char c) {
    return c == '\n' || c == '\r';
}

static std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

void LineAssembler::feed(const char* data, std::size_t len, const Emit& emit) {
    if (len == 0) return;
    pending_.append(data, len);

    std::size_t start = 0;
    std::size_t i = 0;
    while (i < pending_.size()) {
        if (!is_break(pending_[i])) {
            ++i;
            continue;
        }
        // Runs of breaks collapse, so an empty segment is never a real line
        if (i > start && emit) {
            emit(pending_.substr(start, i - start));
        }
        while (i < pending_.size() && is_break(pending_[i])) ++i;
        start = i;
    }
    pending_.erase(0, start);
}

void LineAssembler::feed(const std::string& chunk, const Emit& emit) {
    feed(chunk.data(), chunk.size(), emit);
}

void LineAssembler::flush(const Emit& emit) {
    std::string line = trim(pending_);
    pending_.clear();
    if (!line.empty() && emit) {
        emit(line);
    }
}

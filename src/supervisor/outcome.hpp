#pragma once

#include <functional>
#include <string>

/// What a start() callback is told. A Launch outcome answers the start
/// request itself; an Exit outcome is the single terminal notification
/// for a supervised process.
struct Outcome {
    enum class Stage { Launch, Exit };

    Stage stage = Stage::Launch;
    bool success = true;
    std::string error;

    int exit_code = -1;   // -1 when the process was killed by a signal or never ran
    int signal = 0;       // terminating signal, 0 if none
    bool stopped = false; // terminated because stop/restart asked for it

    static Outcome launched() { return Outcome(); }

    static Outcome failed(Stage stage, std::string error) {
        Outcome o;
        o.stage = stage;
        o.success = false;
        o.error = std::move(error);
        return o;
    }
};

using Callback = std::function<void(const Outcome& outcome)>;

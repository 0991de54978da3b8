#include "core/diagnostics.hpp"

#include <iostream>

Diagnostics default_diagnostics() {
    return [](const std::string& message) {
        std::cerr << "minipm: " << message << "\n";
    };
}

void report(const Diagnostics& diag, const std::string& message) {
    if (diag) {
        diag(message);
    } else {
        std::cerr << "minipm: " << message << "\n";
    }
}

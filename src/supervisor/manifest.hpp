#pragma once

#include <string>

/// package.json lookup for directories started without an explicit script
class Manifest {
public:
    static constexpr const char* kFileName = "package.json";

    /// The "main" entry of <cwd>/package.json, or "" on any failure
    static std::string entry_point(const std::string& cwd);
};

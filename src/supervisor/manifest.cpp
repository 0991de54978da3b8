#include "supervisor/manifest.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Manifest::entry_point(const std::string& cwd) {
    if (cwd.empty()) return "";

    try {
        std::ifstream file(fs::path(cwd) / kFileName);
        if (!file.is_open()) return "";

        json manifest = json::parse(file);
        if (!manifest.is_object()) return "";

        auto it = manifest.find("main");
        if (it == manifest.end() || !it->is_string()) return "";
        return it->get<std::string>();
    } catch (const std::exception&) {
        // Unreadable or malformed manifest means "no script"
        return "";
    }
}

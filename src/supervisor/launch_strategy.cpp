#include "supervisor/launch_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

SpawnOptions LaunchStrategy::base_options(const std::string& interpreter,
                                          const LaunchParams& params,
                                          const std::string& script) {
    SpawnOptions opts;
    opts.executable = interpreter;
    opts.args.push_back(script);
    opts.args.insert(opts.args.end(), params.args.begin(), params.args.end());
    opts.cwd = params.cwd;
    opts.env = params.env;
    opts.capture_output = true;
    opts.detached = false;
    return opts;
}

NodeStrategy::NodeStrategy(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

SpawnOptions NodeStrategy::prepare(const LaunchParams& params, const std::string& script) const {
    SpawnOptions opts = base_options(interpreter_, params, script);
    opts.open_channel = true;
    opts.channel_env = "NODE_CHANNEL_FD";
    opts.env["NODE_CHANNEL_SERIALIZATION_MODE"] = "json";
    return opts;
}

PythonStrategy::PythonStrategy(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

SpawnOptions PythonStrategy::prepare(const LaunchParams& params, const std::string& script) const {
    return base_options(interpreter_, params, script);
}

StrategyTable StrategyTable::with_defaults(const std::string& node_interpreter,
                                           const std::string& python_interpreter) {
    StrategyTable table;
    auto node = std::make_shared<NodeStrategy>(node_interpreter);
    table.add(".js", node);
    table.add(".mjs", node);
    table.add(".cjs", node);
    table.add(".py", std::make_shared<PythonStrategy>(python_interpreter));
    return table;
}

std::string StrategyTable::normalize(const std::string& ext) {
    std::string key = ext;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!key.empty() && key[0] != '.') key.insert(key.begin(), '.');
    return key;
}

void StrategyTable::add(const std::string& ext, std::shared_ptr<const LaunchStrategy> strategy) {
    std::string key = normalize(ext);
    if (key.empty() || !strategy) return;
    strategies_[key] = std::move(strategy);
}

std::string StrategyTable::extension_of(const std::string& script) {
    if (script.empty()) return "";
    std::string ext = fs::path(script).extension().string();
    if (ext == ".") return "";
    return normalize(ext);
}

const LaunchStrategy* StrategyTable::select(const std::string& script) const {
    std::string ext = extension_of(script);
    if (ext.empty()) return nullptr;
    auto it = strategies_.find(ext);
    if (it == strategies_.end()) return nullptr;
    return it->second.get();
}

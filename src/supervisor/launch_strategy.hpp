#pragma once

#include "supervisor/child_process.hpp"
#include "supervisor/launch_params.hpp"

#include <map>
#include <memory>
#include <string>

/// Recipe for starting one family of scripts
class LaunchStrategy {
public:
    virtual ~LaunchStrategy() = default;

    /// Short family name ("node", "python", ...)
    virtual std::string family() const = 0;

    /// Spawn options for script, resolved from params
    virtual SpawnOptions prepare(const LaunchParams& params, const std::string& script) const = 0;

protected:
    /// Options every family shares: argv = [script, args...], captured, attached
    static SpawnOptions base_options(const std::string& interpreter,
                                     const LaunchParams& params,
                                     const std::string& script);
};

/// Same-runtime scripts: run under node with an IPC channel on fd 3
class NodeStrategy : public LaunchStrategy {
public:
    explicit NodeStrategy(std::string interpreter = "node");

    std::string family() const override { return "node"; }
    SpawnOptions prepare(const LaunchParams& params, const std::string& script) const override;

private:
    std::string interpreter_;
};

/// External-interpreter scripts: python <script> <args...>
class PythonStrategy : public LaunchStrategy {
public:
    explicit PythonStrategy(std::string interpreter = "python");

    std::string family() const override { return "python"; }
    SpawnOptions prepare(const LaunchParams& params, const std::string& script) const override;

private:
    std::string interpreter_;
};

/// Extension -> strategy lookup
class StrategyTable {
public:
    /// .js/.mjs/.cjs -> node, .py -> python
    static StrategyTable with_defaults(const std::string& node_interpreter = "node",
                                       const std::string& python_interpreter = "python");

    /// Register (or replace) the strategy for ext, given with or without the dot
    void add(const std::string& ext, std::shared_ptr<const LaunchStrategy> strategy);

    /// nullptr when script has no extension or nobody handles it
    const LaunchStrategy* select(const std::string& script) const;

    /// Lower-cased extension including the dot, "" if none
    static std::string extension_of(const std::string& script);

    std::size_t size() const { return strategies_.size(); }

private:
    std::map<std::string, std::shared_ptr<const LaunchStrategy>> strategies_;

    static std::string normalize(const std::string& ext);
};

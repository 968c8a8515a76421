#pragma once
#include "engine.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace chorus {

using EngineFactory = std::function<std::unique_ptr<ExecutionEngine>(const Config& config)>;

// Central registry for self-registering execution engines.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_engine(const std::string& name, EngineFactory factory);

    // Throws std::invalid_argument for an unknown name
    std::unique_ptr<ExecutionEngine> create_engine(const std::string& name,
                                                   const Config& config) const;

    std::vector<std::string> engine_names() const;
    bool has_engine(const std::string& name) const;

    // Testing support
    bool unregister_engine(const std::string& name);

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, EngineFactory> engines_;
};

// Self-registrar helper, used at file scope in each engine .cpp
struct EngineRegistrar {
    EngineRegistrar(const std::string& name, EngineFactory factory) {
        PluginRegistry::instance().register_engine(name, std::move(factory));
    }
};

} // namespace chorus

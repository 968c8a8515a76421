#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace chorus {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_engine(const std::string& name, EngineFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    engines_[name] = std::move(factory);
}

std::unique_ptr<ExecutionEngine> PluginRegistry::create_engine(const std::string& name,
                                                               const Config& config) const {
    EngineFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = engines_.find(name);
        if (it == engines_.end()) {
            throw std::invalid_argument("Unknown engine: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

std::vector<std::string> PluginRegistry::engine_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(engines_.size());
    for (const auto& [name, _] : engines_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_engine(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.count(name) > 0;
}

bool PluginRegistry::unregister_engine(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.erase(name) > 0;
}

} // namespace chorus

#include "infrastructure/plugin/BuiltinPluginRegistry.hpp"

#include <cstring>
#include <spdlog/spdlog.h>

namespace journal::infra {

void BuiltinPluginRegistry::registerFactory(const std::string& name, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[name] = std::move(factory);
    spdlog::debug("Builtin plugin registered: {}", name);
}

bool BuiltinPluginRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.find(name) != factories_.end();
}

std::unique_ptr<core::IPlugin> BuiltinPluginRegistry::create(const std::string& name) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            return nullptr;
        }
        factory = it->second;
    }
    return factory();
}

std::vector<std::string> BuiltinPluginRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, _] : factories_) {
        result.push_back(name);
    }
    return result;
}

bool BuiltinPluginRegistry::isBuiltinEntryPoint(const std::string& entryPoint) {
    return entryPoint.rfind(kEntryPointPrefix, 0) == 0;
}

std::string BuiltinPluginRegistry::builtinName(const std::string& entryPoint) {
    return entryPoint.substr(std::strlen(kEntryPointPrefix));
}

} // namespace journal::infra

/**
 * @file BuiltinPluginRegistry.hpp
 * @brief Factories for plugins compiled into the host.
 *
 * A manifest whose entry point is "builtin:<name>" is instantiated from the
 * factory registered under <name> instead of from a module in its package.
 */

#pragma once

#include "core/plugin/IPlugin.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace journal::infra {

class BuiltinPluginRegistry {
public:
    using Factory = std::function<std::unique_ptr<core::IPlugin>()>;

    static constexpr const char* kEntryPointPrefix = "builtin:";

    /**
     * @brief Registers a factory, replacing any previous one with the same name.
     * @param name Builtin name, without the "builtin:" prefix.
     * @param factory Function constructing a new plugin instance.
     */
    void registerFactory(const std::string& name, Factory factory);

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @brief Constructs a plugin from a registered factory.
     * @param name Builtin name.
     * @return New instance, or nullptr if no factory is registered under name.
     */
    [[nodiscard]] std::unique_ptr<core::IPlugin> create(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] static bool isBuiltinEntryPoint(const std::string& entryPoint);

    /**
     * @brief Strips the "builtin:" prefix.
     * @param entryPoint Entry point that satisfies isBuiltinEntryPoint().
     * @return The builtin name.
     */
    [[nodiscard]] static std::string builtinName(const std::string& entryPoint);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
};

} // namespace journal::infra

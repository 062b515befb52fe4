/**
 * @file IPlugin.hpp
 * @brief Base plugin interface and the C entry points of plugin modules.
 */

#pragma once

#include "core/plugin/Capability.hpp"
#include "core/plugin/PluginManifest.hpp"

#include <string>
#include <vector>

namespace journal::core {

class IPluginContext;

/**
 * @brief Base interface for all plugins.
 *
 * A plugin is constructed by its entry point, initialized once with a
 * context, queried for capabilities while loaded, and shut down before it is
 * destroyed. The host catches exceptions thrown from any of these calls.
 */
class IPlugin {
public:
    virtual ~IPlugin() = default;

    /**
     * @brief Gets the manifest the implementation was built for.
     * @return Reference to the plugin's manifest.
     */
    [[nodiscard]] virtual const PluginManifest& manifest() const = 0;

    /**
     * @brief Initializes the plugin.
     * @param context The plugin context for accessing host services. Outlives the plugin.
     * @return True if initialization succeeded.
     */
    virtual bool initialize(IPluginContext* context) = 0;

    /**
     * @brief Shuts down the plugin and releases resources.
     * @return True if shutdown completed cleanly.
     */
    virtual bool shutdown() = 0;

    /**
     * @brief Lists the capabilities this plugin exposes.
     *
     * Capability functions may be invoked concurrently from worker threads
     * while the plugin is loaded.
     *
     * @return Capabilities of any kind.
     */
    [[nodiscard]] virtual std::vector<Capability> getCapabilities() const = 0;

    /**
     * @brief Gets a human-readable status message.
     * @return Status message, used as the error detail when initialize() fails.
     */
    [[nodiscard]] virtual std::string statusMessage() const = 0;
};

} // namespace journal::core

/// Symbol a plugin module exports to construct its plugin.
#define JOURNAL_PLUGIN_CREATE_SYMBOL "journal_create_plugin"
/// Symbol a plugin module exports to destroy a plugin it created.
#define JOURNAL_PLUGIN_DESTROY_SYMBOL "journal_destroy_plugin"

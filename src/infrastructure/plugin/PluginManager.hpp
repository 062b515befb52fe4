#pragma once

#include "core/plugin/IPlugin.hpp"
#include "core/plugin/PluginManifest.hpp"
#include "core/plugin/PluginResult.hpp"
#include "infrastructure/plugin/AnalyticsDispatcher.hpp"
#include "infrastructure/plugin/BuiltinPluginRegistry.hpp"
#include "infrastructure/plugin/PluginContext.hpp"
#include "infrastructure/plugin/PluginPackage.hpp"
#include "infrastructure/plugin/PluginStore.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace journal::infra {

/**
 * @brief Settings of a PluginManager instance.
 */
struct PluginManagerConfig {
    std::filesystem::path pluginDir;                       ///< Installed "<id>.jpkg" packages
    std::filesystem::path dataDir;                         ///< Per-plugin data and module cache
    std::string appVersion{"1.0.0"};
    std::chrono::milliseconds loadTimeout{2000};           ///< Upper bound on reading one package
    std::chrono::milliseconds analyzerTimeout{5000};       ///< Upper bound on one analytics pass
    bool enforcePermissions{true};
};

/**
 * @brief Manages plugin installation, loading, and lifecycle.
 *
 * Owns the catalogue of installed plugins and the live instances of loaded
 * ones. Mutating operations are serialized; read-only queries and dispatch
 * run concurrently with them against a consistent snapshot and never see a
 * half-loaded or half-unloaded plugin.
 *
 * Packages are parsed and validated before anything is written, so a failed
 * install leaves the catalogue unchanged. Enable flags persist through the
 * preference store under "plugin_enabled_<id>".
 *
 * @note Callbacks run on the thread performing the mutation and must not call
 *       mutating methods of the same manager.
 */
class PluginManager {
public:
    using PluginLoadedCallback = std::function<void(const std::string&, core::IPlugin*)>;
    using PluginUnloadedCallback = std::function<void(const std::string&)>;
    using PluginErrorCallback = std::function<void(const std::string&, const core::PluginError&)>;

    /**
     * @brief Constructs a PluginManager.
     * @param config Directories, version and timeouts.
     * @param services Host services handed to plugins through their contexts.
     * @param builtins Factories for "builtin:" entry points. May be null.
     */
    PluginManager(
        PluginManagerConfig config,
        PluginHostServices services,
        std::shared_ptr<const BuiltinPluginRegistry> builtins = nullptr);

    /**
     * @brief Destructor. Shuts down and unloads all plugins.
     */
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    /**
     * @brief Builds the catalogue from the plugin directory.
     *
     * Every package is registered; those whose persisted flag is enabled are
     * loaded when autoLoadEnabled is set. A package that cannot be read is
     * registered as a placeholder entry carrying the error.
     *
     * @param autoLoadEnabled Load enabled plugins after registering them.
     */
    void start(bool autoLoadEnabled = true);

    /**
     * @brief Installs a package, enables it and loads it.
     *
     * Reinstalling an id replaces the stored package and unloads the old
     * instance first.
     *
     * @param packageBytes Raw package contents.
     * @return The loaded instance, or the error of the first failing step.
     */
    core::PluginResult<std::shared_ptr<core::IPlugin>> install(const Bytes& packageBytes);

    /**
     * @brief Reads a package file and installs it.
     * @param packagePath Path to a package file.
     * @return As install().
     */
    core::PluginResult<std::shared_ptr<core::IPlugin>> installFromFile(const std::filesystem::path& packagePath);

    /**
     * @brief Removes a plugin, its stored package, module cache and enable flag.
     * @param pluginId Plugin id. Unknown ids succeed without effect.
     * @return Empty result, or StoreWriteFailed.
     */
    core::PluginResult<void> uninstall(const std::string& pluginId);

    /**
     * @brief Loads and initializes the plugin in a package file.
     *
     * A package that is not in the catalogue yet is registered as enabled.
     *
     * @param packagePath Path to a package file.
     * @return The loaded instance, or an error.
     */
    core::PluginResult<std::shared_ptr<core::IPlugin>> load(const std::filesystem::path& packagePath);

    /**
     * @brief Shuts down and releases a loaded plugin.
     *
     * The plugin is unloaded even when its shutdown fails.
     *
     * @param pluginId Plugin id.
     * @return Empty result, NotLoaded, or PluginShutdownFailed.
     */
    core::PluginResult<void> unload(const std::string& pluginId);

    /**
     * @brief Unloads every plugin, most recently loaded first.
     */
    void unloadAll();

    /**
     * @brief Persists the enabled flag and loads the plugin if needed.
     * @param pluginId Plugin id.
     * @return Empty result, PluginNotFound, or the load error.
     */
    core::PluginResult<void> enable(const std::string& pluginId);

    /**
     * @brief Persists the disabled flag and unloads the plugin if loaded.
     * @param pluginId Plugin id.
     * @return Empty result, PluginNotFound, or PluginShutdownFailed.
     */
    core::PluginResult<void> disable(const std::string& pluginId);

    /**
     * @brief Gets the catalogue, sorted by id.
     * @return One PluginInfo per installed plugin.
     */
    [[nodiscard]] std::vector<core::PluginInfo> installedPlugins() const;

    [[nodiscard]] std::optional<core::PluginInfo> pluginInfo(const std::string& pluginId) const;

    /**
     * @brief Gets a loaded plugin by ID.
     * @param pluginId Plugin id.
     * @return Shared pointer to the plugin, or nullptr if not loaded.
     */
    [[nodiscard]] std::shared_ptr<core::IPlugin> getPlugin(const std::string& pluginId) const;

    [[nodiscard]] bool isLoaded(const std::string& pluginId) const;

    /**
     * @brief Gets IDs of all loaded plugins.
     * @return Plugin ids in load order.
     */
    [[nodiscard]] std::vector<std::string> getLoadedPluginIds() const;

    /**
     * @brief Gets the capabilities of one kind across loaded plugins.
     *
     * The returned functions are only valid while their plugin stays loaded.
     * Use getCapabilityEntries() to hold the owning plugin as well.
     *
     * @param kind Capability kind.
     * @return Capabilities in plugin load order, then declaration order.
     */
    [[nodiscard]] std::vector<core::Capability> getCapabilities(core::CapabilityKind kind) const;

    /**
     * @brief Gets capabilities of one kind together with their owning plugins.
     */
    [[nodiscard]] std::vector<CapabilityEntry> getCapabilityEntries(core::CapabilityKind kind) const;

    /**
     * @brief Runs every analytics capability against a context.
     * @param context The analysis input.
     * @return Completed results and per-analyzer failures.
     */
    [[nodiscard]] AnalyticsBatch executeAnalytics(const core::AnalyticsContext& context) const;

    [[nodiscard]] ConversationalBatch queryConversational(const core::ConversationalQuery& query) const;

    [[nodiscard]] VisualizationBatch renderVisualization(const core::VisualizationContext& context) const;

    void onPluginLoaded(PluginLoadedCallback callback);
    void onPluginUnloaded(PluginUnloadedCallback callback);
    void onPluginError(PluginErrorCallback callback);

    [[nodiscard]] const PluginStore& store() const { return store_; }
    [[nodiscard]] const PluginManagerConfig& config() const { return config_; }

    /**
     * @brief Builds the preference key of a plugin's enabled flag.
     * @param pluginId Plugin id.
     * @return Key in format "plugin_enabled_<id>".
     */
    static std::string enabledPreferenceKey(const std::string& pluginId);

    /// Directory handed to a plugin's context, removed on uninstall.
    [[nodiscard]] std::filesystem::path pluginDataDir(const std::string& pluginId) const;

private:
    struct CatalogueEntry {
        core::PluginManifest manifest;
        std::filesystem::path packagePath;
        bool enabled{false};
        std::optional<std::string> error;
    };

    struct LoadedPlugin {
        std::shared_ptr<core::IPlugin> instance;
        std::vector<core::Capability> capabilities;
        std::filesystem::path path;
    };

    // The *Locked helpers expect writeMutex_ to be held by the caller.
    core::PluginResult<std::shared_ptr<core::IPlugin>> loadLocked(const std::filesystem::path& packagePath);
    core::PluginResult<void> unloadLocked(const std::string& pluginId);
    core::PluginResult<void> enableLocked(const std::string& pluginId);
    core::PluginResult<void> disableLocked(const std::string& pluginId);

    core::PluginResult<std::shared_ptr<core::IPlugin>> instantiate(
        const PluginPackage& package,
        const std::shared_ptr<PluginContext>& context);

    void rebuildCapabilityIndex();
    void persistEnabled(const std::string& pluginId, bool enabled);
    core::PluginError fail(const std::string& pluginId, core::PluginError error);
    core::PluginInfo toInfo(const CatalogueEntry& entry) const;

    PluginManagerConfig config_;
    PluginHostServices services_;
    std::shared_ptr<const BuiltinPluginRegistry> builtins_;
    PluginStore store_;
    AnalyticsDispatcher dispatcher_;

    std::mutex writeMutex_;
    mutable std::shared_mutex stateMutex_;
    std::map<std::string, CatalogueEntry> catalogue_;
    std::map<std::string, LoadedPlugin> loadedPlugins_;
    std::vector<std::string> loadOrder_;
    std::vector<CapabilityEntry> capabilityIndex_;

    mutable std::mutex callbacksMutex_;
    std::vector<PluginLoadedCallback> loadedCallbacks_;
    std::vector<PluginUnloadedCallback> unloadedCallbacks_;
    std::vector<PluginErrorCallback> errorCallbacks_;
};

} // namespace journal::infra

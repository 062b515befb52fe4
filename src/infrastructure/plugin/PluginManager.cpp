#include "infrastructure/plugin/PluginManager.hpp"
#include "infrastructure/plugin/SharedLibrary.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace journal::infra {

using core::PluginErrorCode;
using core::PluginResult;
using PluginPtr = std::shared_ptr<core::IPlugin>;

using CreatePluginFunc = core::IPlugin* (*)();
using DestroyPluginFunc = void (*)(core::IPlugin*);

PluginManager::PluginManager(
    PluginManagerConfig config,
    PluginHostServices services,
    std::shared_ptr<const BuiltinPluginRegistry> builtins)
    : config_(std::move(config))
    , services_(std::move(services))
    , builtins_(std::move(builtins))
    , store_(config_.pluginDir, config_.dataDir / "modules", config_.loadTimeout)
    , dispatcher_(config_.analyzerTimeout) {

    spdlog::info("PluginManager initialized, plugin directory: {}", config_.pluginDir.string());
}

PluginManager::~PluginManager() {
    unloadAll();
}

void PluginManager::start(bool autoLoadEnabled) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    std::size_t registered = 0;
    for (const auto& path : store_.listPackages()) {
        auto stem = path.stem().string();
        {
            std::shared_lock<std::shared_mutex> lock(stateMutex_);
            if (catalogue_.count(stem) > 0) {
                continue;
            }
        }

        auto bytes = store_.read(path);
        auto package = bytes ? PluginPackage::parse(bytes.value())
                             : PluginResult<PluginPackage>::err(bytes.error());
        if (!package) {
            spdlog::warn("Failed to read plugin package {}: {}", path.string(), package.error().toString());
            CatalogueEntry broken;
            broken.manifest.id = stem;
            broken.manifest.name = "Unknown";
            broken.manifest.version = "Unknown";
            broken.manifest.description = "Failed to load";
            broken.manifest.author = "Unknown";
            broken.packagePath = path;
            broken.error = package.error().message;
            {
                std::unique_lock<std::shared_mutex> lock(stateMutex_);
                catalogue_[stem] = std::move(broken);
            }
            ++registered;
            continue;
        }

        const auto& manifest = package.value().manifest();
        if (manifest.id != stem) {
            spdlog::warn("Package {} declares plugin id {}", path.filename().string(), manifest.id);
        }

        bool enabled = services_.preferences &&
            services_.preferences->getBool(enabledPreferenceKey(manifest.id), false);
        {
            std::unique_lock<std::shared_mutex> lock(stateMutex_);
            if (catalogue_.count(manifest.id) > 0) {
                spdlog::warn("Duplicate package for plugin {} ignored: {}", manifest.id, path.string());
                continue;
            }
            catalogue_[manifest.id] = CatalogueEntry{manifest, path, enabled, std::nullopt};
        }
        ++registered;

        if (enabled && autoLoadEnabled) {
            auto loaded = loadLocked(path);
            if (!loaded) {
                spdlog::error("Failed to load enabled plugin {}: {}", manifest.id, loaded.error().toString());
            }
        }
    }

    spdlog::info("Discovered {} plugins, {} loaded", registered, loadOrder_.size());
}

PluginResult<PluginPtr> PluginManager::install(const Bytes& packageBytes) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    auto package = PluginPackage::parse(packageBytes);
    if (!package) {
        spdlog::error("Rejected plugin package: {}", package.error().toString());
        return PluginResult<PluginPtr>::err(package.error());
    }
    const auto manifest = package.value().manifest();

    if (isLoaded(manifest.id)) {
        spdlog::info("Reinstalling plugin {}, unloading current instance", manifest.id);
        auto unloaded = unloadLocked(manifest.id);
        if (!unloaded) {
            spdlog::warn("Previous instance of {} did not shut down cleanly: {}",
                manifest.id, unloaded.error().toString());
        }
    }

    auto written = store_.write(manifest.id, packageBytes);
    if (!written) {
        return PluginResult<PluginPtr>::err(fail(manifest.id, written.error()));
    }

    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        catalogue_[manifest.id] = CatalogueEntry{manifest, store_.packagePath(manifest.id), false, std::nullopt};
    }
    spdlog::info("Plugin installed: {} v{} ({})", manifest.name, manifest.version, manifest.id);

    auto enabled = enableLocked(manifest.id);
    if (!enabled) {
        return PluginResult<PluginPtr>::err(enabled.error());
    }

    auto plugin = getPlugin(manifest.id);
    if (!plugin) {
        return PluginResult<PluginPtr>::err(PluginErrorCode::NotLoaded,
            "Plugin " + manifest.id + " was not loaded after install");
    }
    return PluginResult<PluginPtr>::ok(plugin);
}

PluginResult<PluginPtr> PluginManager::installFromFile(const std::filesystem::path& packagePath) {
    auto bytes = store_.read(packagePath);
    if (!bytes) {
        spdlog::error("Cannot install {}: {}", packagePath.string(), bytes.error().toString());
        return PluginResult<PluginPtr>::err(bytes.error());
    }
    return install(bytes.value());
}

PluginResult<void> PluginManager::uninstall(const std::string& pluginId) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    std::optional<std::filesystem::path> packagePath;
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        auto it = catalogue_.find(pluginId);
        if (it != catalogue_.end()) {
            packagePath = it->second.packagePath;
        }
    }
    if (!packagePath) {
        spdlog::debug("Uninstall of unknown plugin {} ignored", pluginId);
        return PluginResult<void>::ok();
    }

    auto disabled = disableLocked(pluginId);
    if (!disabled) {
        spdlog::warn("Uninstalling {} despite shutdown failure: {}", pluginId, disabled.error().toString());
    }

    // Broken entries keyed by an odd file name only own their package file.
    if (core::isValidPluginId(pluginId)) {
        auto removed = store_.remove(pluginId);
        if (!removed) {
            return PluginResult<void>::err(fail(pluginId, removed.error()));
        }

        std::error_code ec;
        auto dataDir = pluginDataDir(pluginId);
        std::filesystem::remove_all(dataDir, ec);
        if (ec) {
            return PluginResult<void>::err(fail(pluginId, core::PluginError{PluginErrorCode::StoreWriteFailed,
                "Failed to delete " + dataDir.string() + ": " + ec.message()}));
        }
    }

    std::error_code ec;
    if (store_.holds(*packagePath) && std::filesystem::exists(*packagePath, ec)) {
        auto removed = store_.removePackageFile(*packagePath);
        if (!removed) {
            return PluginResult<void>::err(fail(pluginId, removed.error()));
        }
    }

    if (services_.preferences) {
        if (!services_.preferences->remove(enabledPreferenceKey(pluginId))) {
            spdlog::warn("Failed to remove enabled flag for plugin {}", pluginId);
        }
        if (!services_.preferences->removePrefix(PluginContext::preferenceKey(pluginId, ""))) {
            spdlog::warn("Failed to remove settings of plugin {}", pluginId);
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        catalogue_.erase(pluginId);
    }

    spdlog::info("Plugin uninstalled: {}", pluginId);
    return PluginResult<void>::ok();
}

PluginResult<PluginPtr> PluginManager::load(const std::filesystem::path& packagePath) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    return loadLocked(packagePath);
}

PluginResult<void> PluginManager::unload(const std::string& pluginId) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    return unloadLocked(pluginId);
}

void PluginManager::unloadAll() {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    std::vector<std::string> pluginIds;
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        pluginIds.assign(loadOrder_.rbegin(), loadOrder_.rend());
    }

    for (const auto& id : pluginIds) {
        auto result = unloadLocked(id);
        if (!result) {
            spdlog::warn("Unload of {} reported: {}", id, result.error().toString());
        }
    }
}

PluginResult<void> PluginManager::enable(const std::string& pluginId) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    return enableLocked(pluginId);
}

PluginResult<void> PluginManager::disable(const std::string& pluginId) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    return disableLocked(pluginId);
}

PluginResult<PluginPtr> PluginManager::loadLocked(const std::filesystem::path& packagePath) {
    auto fallbackId = packagePath.stem().string();

    auto bytes = store_.read(packagePath);
    if (!bytes) {
        return PluginResult<PluginPtr>::err(fail(fallbackId, bytes.error()));
    }

    auto package = PluginPackage::parse(bytes.value());
    if (!package) {
        return PluginResult<PluginPtr>::err(fail(fallbackId, package.error()));
    }
    const auto& manifest = package.value().manifest();

    if (isLoaded(manifest.id)) {
        spdlog::warn("Plugin already loaded: {}", manifest.id);
        return PluginResult<PluginPtr>::err(PluginErrorCode::AlreadyLoaded,
            "Plugin " + manifest.id + " is already loaded");
    }

    for (const auto& dependency : manifest.dependencies) {
        if (!isLoaded(dependency)) {
            spdlog::warn("Plugin {} declares dependency {} which is not loaded", manifest.id, dependency);
        }
    }

    auto dataDir = pluginDataDir(manifest.id);
    auto context = std::make_shared<PluginContext>(
        manifest, services_, dataDir.string(), config_.appVersion, config_.enforcePermissions);

    auto created = instantiate(package.value(), context);
    if (!created) {
        return PluginResult<PluginPtr>::err(fail(manifest.id, created.error()));
    }
    auto plugin = created.value();

    if (plugin->manifest().id != manifest.id) {
        return PluginResult<PluginPtr>::err(fail(manifest.id, core::PluginError{PluginErrorCode::ManifestInvalid,
            "Entry point " + manifest.entryPoint + " implements plugin " + plugin->manifest().id}));
    }

    try {
        if (!plugin->initialize(context.get())) {
            return PluginResult<PluginPtr>::err(fail(manifest.id, core::PluginError{
                PluginErrorCode::PluginInitFailed, "Initialization failed: " + plugin->statusMessage()}));
        }
    } catch (const std::exception& e) {
        return PluginResult<PluginPtr>::err(fail(manifest.id, core::PluginError{
            PluginErrorCode::PluginInitFailed, std::string("Initialization exception: ") + e.what()}));
    }

    std::vector<core::Capability> capabilities;
    try {
        capabilities = plugin->getCapabilities();
    } catch (const std::exception& e) {
        spdlog::error("Plugin {} failed to list capabilities: {}", manifest.id, e.what());
    }

    bool newlyEnabled = false;
    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        auto it = catalogue_.find(manifest.id);
        if (it == catalogue_.end()) {
            catalogue_[manifest.id] = CatalogueEntry{manifest, packagePath, true, std::nullopt};
            newlyEnabled = true;
        } else {
            newlyEnabled = !it->second.enabled;
            it->second.manifest = manifest;
            it->second.packagePath = packagePath;
            it->second.enabled = true;
            it->second.error.reset();
        }

        loadedPlugins_[manifest.id] = LoadedPlugin{plugin, std::move(capabilities), packagePath};
        loadOrder_.push_back(manifest.id);
        rebuildCapabilityIndex();
    }
    if (newlyEnabled) {
        persistEnabled(manifest.id, true);
    }

    spdlog::info("Plugin loaded: {} v{} ({})", manifest.name, manifest.version, manifest.id);

    std::vector<PluginLoadedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        callbacks = loadedCallbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(manifest.id, plugin.get());
    }

    return PluginResult<PluginPtr>::ok(plugin);
}

PluginResult<void> PluginManager::unloadLocked(const std::string& pluginId) {
    LoadedPlugin loaded;

    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        auto it = loadedPlugins_.find(pluginId);
        if (it == loadedPlugins_.end()) {
            spdlog::warn("Cannot unload plugin, not loaded: {}", pluginId);
            return PluginResult<void>::err(PluginErrorCode::NotLoaded,
                "Plugin " + pluginId + " is not loaded");
        }

        loaded = std::move(it->second);
        loadedPlugins_.erase(it);
        loadOrder_.erase(std::remove(loadOrder_.begin(), loadOrder_.end(), pluginId), loadOrder_.end());
        rebuildCapabilityIndex();
    }

    std::optional<core::PluginError> shutdownError;
    try {
        if (!loaded.instance->shutdown()) {
            shutdownError = core::PluginError{PluginErrorCode::PluginShutdownFailed,
                "Shutdown failed: " + loaded.instance->statusMessage()};
        }
    } catch (const std::exception& e) {
        shutdownError = core::PluginError{PluginErrorCode::PluginShutdownFailed,
            std::string("Shutdown exception: ") + e.what()};
    }

    // Analyzers still running hold their own references; the module closes after the last one.
    loaded.capabilities.clear();
    loaded.instance.reset();

    spdlog::info("Plugin unloaded: {}", pluginId);

    std::vector<PluginUnloadedCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        callbacks = unloadedCallbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(pluginId);
    }

    if (shutdownError) {
        return PluginResult<void>::err(fail(pluginId, *shutdownError));
    }
    return PluginResult<void>::ok();
}

PluginResult<void> PluginManager::enableLocked(const std::string& pluginId) {
    std::filesystem::path packagePath;
    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        auto it = catalogue_.find(pluginId);
        if (it == catalogue_.end()) {
            return PluginResult<void>::err(PluginErrorCode::PluginNotFound,
                "Plugin " + pluginId + " is not installed");
        }
        it->second.enabled = true;
        packagePath = it->second.packagePath;
    }
    persistEnabled(pluginId, true);
    spdlog::info("Plugin enabled: {}", pluginId);

    if (isLoaded(pluginId)) {
        return PluginResult<void>::ok();
    }

    auto loaded = loadLocked(packagePath);
    if (!loaded) {
        return PluginResult<void>::err(loaded.error());
    }
    return PluginResult<void>::ok();
}

PluginResult<void> PluginManager::disableLocked(const std::string& pluginId) {
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        if (catalogue_.find(pluginId) == catalogue_.end()) {
            return PluginResult<void>::err(PluginErrorCode::PluginNotFound,
                "Plugin " + pluginId + " is not installed");
        }
    }

    // Unload before clearing the flag so readers never see a loaded, disabled plugin.
    auto unloaded = isLoaded(pluginId) ? unloadLocked(pluginId) : PluginResult<void>::ok();

    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        auto it = catalogue_.find(pluginId);
        if (it != catalogue_.end()) {
            it->second.enabled = false;
        }
    }
    persistEnabled(pluginId, false);
    spdlog::info("Plugin disabled: {}", pluginId);

    return unloaded;
}

PluginResult<PluginPtr> PluginManager::instantiate(
    const PluginPackage& package,
    const std::shared_ptr<PluginContext>& context) {

    const auto& manifest = package.manifest();

    if (BuiltinPluginRegistry::isBuiltinEntryPoint(manifest.entryPoint)) {
        auto name = BuiltinPluginRegistry::builtinName(manifest.entryPoint);
        if (!builtins_ || !builtins_->contains(name)) {
            return PluginResult<PluginPtr>::err(PluginErrorCode::EntryPointNotFound,
                "No builtin plugin registered as '" + name + "'");
        }

        std::unique_ptr<core::IPlugin> created;
        try {
            created = builtins_->create(name);
        } catch (const std::exception& e) {
            return PluginResult<PluginPtr>::err(PluginErrorCode::PluginInitFailed,
                std::string("Creation failed: ") + e.what());
        }
        if (!created) {
            return PluginResult<PluginPtr>::err(PluginErrorCode::PluginInitFailed,
                "Creation returned null");
        }

        auto deleter = [context](core::IPlugin* p) { delete p; };
        return PluginResult<PluginPtr>::ok(PluginPtr(created.release(), deleter));
    }

    const auto* module = package.entry(manifest.entryPoint);
    if (!module) {
        return PluginResult<PluginPtr>::err(PluginErrorCode::EntryPointNotFound,
            "Package has no module '" + manifest.entryPoint + "'");
    }

    auto modulePath = store_.extractModule(manifest.id, manifest.entryPoint, *module);
    if (!modulePath) {
        return PluginResult<PluginPtr>::err(modulePath.error());
    }

    auto library = SharedLibrary::open(modulePath.value());
    if (!library) {
        return PluginResult<PluginPtr>::err(library.error());
    }
    auto handle = library.value();

    auto createFunc = handle->function<CreatePluginFunc>(JOURNAL_PLUGIN_CREATE_SYMBOL);
    auto destroyFunc = handle->function<DestroyPluginFunc>(JOURNAL_PLUGIN_DESTROY_SYMBOL);
    if (!createFunc || !destroyFunc) {
        return PluginResult<PluginPtr>::err(PluginErrorCode::EntryPointNotFound,
            manifest.entryPoint + " does not export " JOURNAL_PLUGIN_CREATE_SYMBOL
            " and " JOURNAL_PLUGIN_DESTROY_SYMBOL);
    }

    core::IPlugin* rawPlugin = nullptr;
    try {
        rawPlugin = createFunc();
    } catch (const std::exception& e) {
        return PluginResult<PluginPtr>::err(PluginErrorCode::PluginInitFailed,
            std::string("Creation failed: ") + e.what());
    }
    if (!rawPlugin) {
        return PluginResult<PluginPtr>::err(PluginErrorCode::PluginInitFailed,
            "Creation returned null");
    }

    // The deleter keeps the library and context alive until the instance is gone.
    auto deleter = [destroyFunc, handle, context](core::IPlugin* p) { destroyFunc(p); };
    return PluginResult<PluginPtr>::ok(PluginPtr(rawPlugin, deleter));
}

void PluginManager::rebuildCapabilityIndex() {
    capabilityIndex_.clear();
    for (const auto& id : loadOrder_) {
        const auto& loaded = loadedPlugins_.at(id);
        for (const auto& capability : loaded.capabilities) {
            capabilityIndex_.push_back(CapabilityEntry{id, loaded.instance, capability});
        }
    }
}

void PluginManager::persistEnabled(const std::string& pluginId, bool enabled) {
    if (!services_.preferences) {
        return;
    }
    if (!services_.preferences->setBool(enabledPreferenceKey(pluginId), enabled)) {
        spdlog::warn("Failed to persist enabled flag for plugin {}", pluginId);
    }
}

core::PluginError PluginManager::fail(const std::string& pluginId, core::PluginError error) {
    spdlog::error("Plugin {}: {}", pluginId, error.toString());

    {
        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        auto it = catalogue_.find(pluginId);
        if (it != catalogue_.end()) {
            it->second.error = error.message;
        }
    }

    std::vector<PluginErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        callbacks = errorCallbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(pluginId, error);
    }
    return error;
}

core::PluginInfo PluginManager::toInfo(const CatalogueEntry& entry) const {
    core::PluginInfo info;
    info.manifest = entry.manifest;
    info.isEnabled = entry.enabled;
    info.isLoaded = loadedPlugins_.count(entry.manifest.id) > 0;
    info.error = entry.error;
    return info;
}

std::vector<core::PluginInfo> PluginManager::installedPlugins() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    std::vector<core::PluginInfo> result;
    result.reserve(catalogue_.size());
    for (const auto& [_, entry] : catalogue_) {
        result.push_back(toInfo(entry));
    }
    return result;
}

std::optional<core::PluginInfo> PluginManager::pluginInfo(const std::string& pluginId) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    auto it = catalogue_.find(pluginId);
    if (it == catalogue_.end()) {
        return std::nullopt;
    }
    return toInfo(it->second);
}

PluginPtr PluginManager::getPlugin(const std::string& pluginId) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    auto it = loadedPlugins_.find(pluginId);
    if (it != loadedPlugins_.end()) {
        return it->second.instance;
    }
    return nullptr;
}

bool PluginManager::isLoaded(const std::string& pluginId) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return loadedPlugins_.find(pluginId) != loadedPlugins_.end();
}

std::vector<std::string> PluginManager::getLoadedPluginIds() const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    return loadOrder_;
}

std::vector<core::Capability> PluginManager::getCapabilities(core::CapabilityKind kind) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    std::vector<core::Capability> result;
    for (const auto& entry : capabilityIndex_) {
        if (core::capabilityKind(entry.capability) == kind) {
            result.push_back(entry.capability);
        }
    }
    return result;
}

std::vector<CapabilityEntry> PluginManager::getCapabilityEntries(core::CapabilityKind kind) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    std::vector<CapabilityEntry> result;
    for (const auto& entry : capabilityIndex_) {
        if (core::capabilityKind(entry.capability) == kind) {
            result.push_back(entry);
        }
    }
    return result;
}

AnalyticsBatch PluginManager::executeAnalytics(const core::AnalyticsContext& context) const {
    return dispatcher_.dispatch(getCapabilityEntries(core::CapabilityKind::Analytics), context);
}

ConversationalBatch PluginManager::queryConversational(const core::ConversationalQuery& query) const {
    return dispatcher_.query(getCapabilityEntries(core::CapabilityKind::Conversational), query);
}

VisualizationBatch PluginManager::renderVisualization(const core::VisualizationContext& context) const {
    return dispatcher_.render(getCapabilityEntries(core::CapabilityKind::Visualization), context);
}

void PluginManager::onPluginLoaded(PluginLoadedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacksMutex_);
    loadedCallbacks_.push_back(std::move(callback));
}

void PluginManager::onPluginUnloaded(PluginUnloadedCallback callback) {
    std::lock_guard<std::mutex> lock(callbacksMutex_);
    unloadedCallbacks_.push_back(std::move(callback));
}

void PluginManager::onPluginError(PluginErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacksMutex_);
    errorCallbacks_.push_back(std::move(callback));
}

std::filesystem::path PluginManager::pluginDataDir(const std::string& pluginId) const {
    return config_.dataDir / "plugin-data" / pluginId;
}

std::string PluginManager::enabledPreferenceKey(const std::string& pluginId) {
    return "plugin_enabled_" + pluginId;
}

} // namespace journal::infra

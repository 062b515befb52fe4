#pragma once

#include "core/plugin/IPluginContext.hpp"
#include "core/services/IJournalRepository.hpp"
#include "core/services/INotificationService.hpp"
#include "core/services/IPreferenceStore.hpp"

#include <memory>
#include <string>

namespace journal::infra {

/**
 * @brief Host services shared by every plugin context.
 *
 * Any member may be null. A missing repository reads as empty and a missing
 * notification service routes notifications to the log.
 */
struct PluginHostServices {
    std::shared_ptr<core::IJournalRepository> records;
    std::shared_ptr<core::IPreferenceStore> preferences;
    std::shared_ptr<core::INotificationService> notifications;
};

/**
 * @brief Context object handed to one plugin at initialization.
 *
 * Implements core::IPluginContext on top of the shared host services,
 * enforcing the permissions declared in the plugin's manifest and scoping
 * preference keys to the plugin id. Thread-safe as long as the services are.
 */
class PluginContext : public core::IPluginContext {
public:
    /**
     * @brief Constructs a context for one plugin.
     * @param manifest Manifest of the plugin the context belongs to.
     * @param services Shared host services.
     * @param dataDir Plugin's private data directory. Created if missing.
     * @param appVersion Application version string.
     * @param enforcePermissions When false, every permission check passes.
     */
    PluginContext(
        core::PluginManifest manifest,
        PluginHostServices services,
        std::string dataDir,
        std::string appVersion,
        bool enforcePermissions = true);

    ~PluginContext() override = default;

    [[nodiscard]] std::string pluginId() const override { return manifest_.id; }
    [[nodiscard]] bool hasPermission(core::Permission permission) const override;

    core::PluginResult<std::vector<core::Experience>> readExperiences() override;
    core::PluginResult<std::vector<core::Substance>> readSubstances() override;
    core::PluginResult<int64_t> addExperience(const core::Experience& experience) override;
    core::PluginResult<void> showNotification(const std::string& title,
                                              const std::string& message,
                                              core::NotificationSeverity severity) override;

    [[nodiscard]] std::string getPreference(const std::string& key,
                                            const std::string& defaultValue = "") const override;
    bool setPreference(const std::string& key, const std::string& value) override;

    [[nodiscard]] std::string dataDir() const override { return dataDir_; }
    [[nodiscard]] std::string appVersion() const override { return appVersion_; }

    /**
     * @brief Logs a message at the specified level, tagged with the plugin id.
     * @param level Log level string ("debug", "info", "warning", "error").
     * @param message The message to log.
     */
    void log(const std::string& level, const std::string& message) override;

    /**
     * @brief Builds the store key of a plugin setting.
     * @param pluginId Owning plugin id.
     * @param key Setting key.
     * @return Key in format "plugin_pref_<id>.<key>".
     */
    static std::string preferenceKey(const std::string& pluginId, const std::string& key);

private:
    core::PluginError permissionDenied(core::Permission permission) const;

    core::PluginManifest manifest_;
    PluginHostServices services_;
    std::string dataDir_;
    std::string appVersion_;
    bool enforcePermissions_;
};

} // namespace journal::infra

/**
 * @file IPluginContext.hpp
 * @brief Plugin context interface for accessing host services.
 *
 * This file defines the context that is handed to a plugin at initialize()
 * time. It is the only way a plugin reaches the host's records, notification
 * channel and preference store.
 */

#pragma once

#include "core/plugin/PluginManifest.hpp"
#include "core/plugin/PluginResult.hpp"
#include "core/services/INotificationService.hpp"
#include "core/types/Experience.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace journal::core {

/**
 * @brief Scoped view of host services for one plugin.
 *
 * Every accessor that touches shared host state checks the permission the
 * plugin's manifest declares for it and returns PermissionDenied otherwise.
 * Preferences are namespaced to the plugin and need no permission.
 */
class IPluginContext {
public:
    virtual ~IPluginContext() = default;

    /**
     * @brief Gets the id of the plugin this context belongs to.
     * @return Plugin id.
     */
    [[nodiscard]] virtual std::string pluginId() const = 0;

    /**
     * @brief Checks whether the plugin may use a permission.
     * @param permission The permission to check.
     * @return True if calls guarded by this permission will be allowed.
     */
    [[nodiscard]] virtual bool hasPermission(Permission permission) const = 0;

    /**
     * @brief Reads all experiences. Requires read-experiences.
     * @return The experiences, or PermissionDenied.
     */
    virtual PluginResult<std::vector<Experience>> readExperiences() = 0;

    /**
     * @brief Reads the substance catalogue. Requires read-substances.
     * @return The substances, or PermissionDenied.
     */
    virtual PluginResult<std::vector<Substance>> readSubstances() = 0;

    /**
     * @brief Stores a new experience. Requires write-experiences.
     * @param experience The experience to add.
     * @return The stored experience id, or PermissionDenied.
     */
    virtual PluginResult<int64_t> addExperience(const Experience& experience) = 0;

    /**
     * @brief Posts a notification to the user. Requires send-notifications.
     * @param title Notification title.
     * @param message Notification body.
     * @param severity Severity level.
     * @return Empty result, or PermissionDenied.
     */
    virtual PluginResult<void> showNotification(const std::string& title,
                                                const std::string& message,
                                                NotificationSeverity severity) = 0;

    /**
     * @brief Reads a plugin setting.
     * @param key Setting key, scoped to this plugin.
     * @param defaultValue Value returned when the key is unset.
     * @return Stored value or defaultValue.
     */
    [[nodiscard]] virtual std::string getPreference(const std::string& key,
                                                    const std::string& defaultValue = "") const = 0;

    /**
     * @brief Writes a plugin setting.
     * @param key Setting key, scoped to this plugin.
     * @param value Value to store.
     * @return True if the host persisted the value.
     */
    virtual bool setPreference(const std::string& key, const std::string& value) = 0;

    [[nodiscard]] bool getBoolPreference(const std::string& key, bool defaultValue = false) const {
        return getPreference(key, defaultValue ? "true" : "false") == "true";
    }

    bool setBoolPreference(const std::string& key, bool value) {
        return setPreference(key, value ? "true" : "false");
    }

    /**
     * @brief Gets the plugin's private data directory.
     * @return Path to the data directory.
     */
    [[nodiscard]] virtual std::string dataDir() const = 0;

    /**
     * @brief Gets the host application version.
     * @return Application version string.
     */
    [[nodiscard]] virtual std::string appVersion() const = 0;

    /**
     * @brief Logs a message at the specified level.
     * @param level Log level (e.g., "debug", "info", "warning", "error").
     * @param message The message to log.
     */
    virtual void log(const std::string& level, const std::string& message) = 0;

    void logDebug(const std::string& message) { log("debug", message); }
    void logInfo(const std::string& message) { log("info", message); }
    void logWarning(const std::string& message) { log("warning", message); }
    void logError(const std::string& message) { log("error", message); }
};

} // namespace journal::core

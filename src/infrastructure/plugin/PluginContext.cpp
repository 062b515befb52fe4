#include "infrastructure/plugin/PluginContext.hpp"

#include <filesystem>
#include <spdlog/spdlog.h>

namespace journal::infra {

using core::Permission;
using core::PluginErrorCode;
using core::PluginResult;

PluginContext::PluginContext(
    core::PluginManifest manifest,
    PluginHostServices services,
    std::string dataDir,
    std::string appVersion,
    bool enforcePermissions)
    : manifest_(std::move(manifest))
    , services_(std::move(services))
    , dataDir_(std::move(dataDir))
    , appVersion_(std::move(appVersion))
    , enforcePermissions_(enforcePermissions) {

    std::error_code ec;
    std::filesystem::create_directories(dataDir_, ec);
    if (ec) {
        spdlog::warn("Failed to create data directory for plugin {}: {}", manifest_.id, ec.message());
    }
}

bool PluginContext::hasPermission(Permission permission) const {
    return !enforcePermissions_ || manifest_.hasPermission(permission);
}

PluginResult<std::vector<core::Experience>> PluginContext::readExperiences() {
    if (!hasPermission(Permission::ReadExperiences)) {
        return PluginResult<std::vector<core::Experience>>::err(
            permissionDenied(Permission::ReadExperiences));
    }
    if (!services_.records) {
        return PluginResult<std::vector<core::Experience>>::ok({});
    }
    return PluginResult<std::vector<core::Experience>>::ok(services_.records->getExperiences());
}

PluginResult<std::vector<core::Substance>> PluginContext::readSubstances() {
    if (!hasPermission(Permission::ReadSubstances)) {
        return PluginResult<std::vector<core::Substance>>::err(
            permissionDenied(Permission::ReadSubstances));
    }
    if (!services_.records) {
        return PluginResult<std::vector<core::Substance>>::ok({});
    }
    return PluginResult<std::vector<core::Substance>>::ok(services_.records->getSubstances());
}

PluginResult<int64_t> PluginContext::addExperience(const core::Experience& experience) {
    if (!hasPermission(Permission::WriteExperiences)) {
        return PluginResult<int64_t>::err(permissionDenied(Permission::WriteExperiences));
    }
    if (!services_.records) {
        return PluginResult<int64_t>::err(PluginErrorCode::StoreWriteFailed,
            "No record store is available");
    }
    auto id = services_.records->addExperience(experience);
    spdlog::debug("[plugin:{}] Added experience {}", manifest_.id, id);
    return PluginResult<int64_t>::ok(id);
}

PluginResult<void> PluginContext::showNotification(const std::string& title,
                                                   const std::string& message,
                                                   core::NotificationSeverity severity) {
    if (!hasPermission(Permission::SendNotifications)) {
        return PluginResult<void>::err(permissionDenied(Permission::SendNotifications));
    }
    if (services_.notifications) {
        services_.notifications->showNotification(manifest_.id, title, message, severity);
    } else {
        spdlog::info("[plugin:{}] {} ({}): {}", manifest_.id, title,
            core::notificationSeverityToString(severity), message);
    }
    return PluginResult<void>::ok();
}

std::string PluginContext::getPreference(const std::string& key, const std::string& defaultValue) const {
    if (!services_.preferences) {
        return defaultValue;
    }
    return services_.preferences->getString(preferenceKey(manifest_.id, key), defaultValue);
}

bool PluginContext::setPreference(const std::string& key, const std::string& value) {
    if (!services_.preferences) {
        return false;
    }
    return services_.preferences->set(preferenceKey(manifest_.id, key), value);
}

void PluginContext::log(const std::string& level, const std::string& message) {
    if (level == "debug") {
        spdlog::debug("[plugin:{}] {}", manifest_.id, message);
    } else if (level == "info") {
        spdlog::info("[plugin:{}] {}", manifest_.id, message);
    } else if (level == "warning" || level == "warn") {
        spdlog::warn("[plugin:{}] {}", manifest_.id, message);
    } else if (level == "error") {
        spdlog::error("[plugin:{}] {}", manifest_.id, message);
    } else {
        spdlog::info("[plugin:{}] {}", manifest_.id, message);
    }
}

std::string PluginContext::preferenceKey(const std::string& pluginId, const std::string& key) {
    return "plugin_pref_" + pluginId + "." + key;
}

core::PluginError PluginContext::permissionDenied(Permission permission) const {
    spdlog::warn("[plugin:{}] Denied call requiring '{}'", manifest_.id,
        core::permissionToString(permission));
    return core::PluginError{PluginErrorCode::PermissionDenied,
        "Plugin " + manifest_.id + " lacks permission " + core::permissionToString(permission)};
}

} // namespace journal::infra

#include "core/plugin/PluginManifest.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace journal::core {

namespace {

const std::array<std::pair<Permission, const char*>, 10> kPermissionNames{{
    {Permission::ReadExperiences, "read-experiences"},
    {Permission::WriteExperiences, "write-experiences"},
    {Permission::ReadSubstances, "read-substances"},
    {Permission::NetworkAccess, "network-access"},
    {Permission::FileSystemAccess, "file-system-access"},
    {Permission::BiometricData, "biometric-data"},
    {Permission::ExportData, "export-data"},
    {Permission::ImportData, "import-data"},
    {Permission::SendNotifications, "send-notifications"},
    {Permission::AnalyticsAccess, "analytics-access"},
}};

bool isBlank(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

std::string permissionToString(Permission permission) {
    for (const auto& [value, name] : kPermissionNames) {
        if (value == permission) {
            return name;
        }
    }
    return "unknown";
}

std::optional<Permission> permissionFromString(const std::string& str) {
    for (const auto& [value, name] : kPermissionNames) {
        if (str == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool isValidPluginId(const std::string& id) {
    if (id.empty() || id.front() == '.') {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '.' || c == '_' || c == '-';
    });
}

PluginResult<void> PluginManifest::validate() const {
    if (isBlank(id)) {
        return PluginResult<void>::err(PluginErrorCode::ManifestInvalid, "Plugin ID cannot be blank");
    }
    if (!isValidPluginId(id)) {
        return PluginResult<void>::err(PluginErrorCode::ManifestInvalid,
            "Plugin ID '" + id + "' may only contain letters, digits, '.', '_' and '-'");
    }
    if (isBlank(name)) {
        return PluginResult<void>::err(PluginErrorCode::ManifestInvalid,
            "Plugin name cannot be blank (" + id + ")");
    }
    if (isBlank(version)) {
        return PluginResult<void>::err(PluginErrorCode::ManifestInvalid,
            "Plugin version cannot be blank (" + id + ")");
    }
    if (isBlank(entryPoint)) {
        return PluginResult<void>::err(PluginErrorCode::ManifestInvalid,
            "Plugin entry point cannot be blank (" + id + ")");
    }
    return PluginResult<void>::ok();
}

nlohmann::json PluginManifest::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["version"] = version;
    j["description"] = description;
    j["author"] = author;
    j["entryPoint"] = entryPoint;

    j["permissions"] = nlohmann::json::array();
    for (auto permission : permissions) {
        j["permissions"].push_back(permissionToString(permission));
    }

    j["dependencies"] = dependencies;
    return j;
}

PluginResult<PluginManifest> PluginManifest::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return PluginResult<PluginManifest>::err(PluginErrorCode::ManifestInvalid,
            "Manifest must be a JSON object");
    }

    PluginManifest manifest;
    try {
        manifest.id = j.value("id", "");
        manifest.name = j.value("name", "");
        manifest.version = j.value("version", "");
        manifest.description = j.value("description", "");
        manifest.author = j.value("author", "");
        manifest.entryPoint = j.value("entryPoint", "");

        if (j.contains("permissions")) {
            for (const auto& entry : j.at("permissions")) {
                auto name = entry.get<std::string>();
                auto permission = permissionFromString(name);
                if (!permission) {
                    return PluginResult<PluginManifest>::err(PluginErrorCode::ManifestInvalid,
                        "Unknown permission '" + name + "'");
                }
                manifest.permissions.insert(*permission);
            }
        }

        if (j.contains("dependencies")) {
            manifest.dependencies = j.at("dependencies").get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        return PluginResult<PluginManifest>::err(PluginErrorCode::ManifestInvalid,
            std::string("Malformed manifest: ") + e.what());
    }

    if (auto valid = manifest.validate(); !valid) {
        return PluginResult<PluginManifest>::err(valid.error());
    }

    return PluginResult<PluginManifest>::ok(std::move(manifest));
}

} // namespace journal::core

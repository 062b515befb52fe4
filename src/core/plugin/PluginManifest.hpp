/**
 * @file PluginManifest.hpp
 * @brief Plugin manifest, permission model and catalogue projection.
 *
 * The manifest is the declarative identity of a plugin package. It is parsed
 * from the package's plugin.json entry at install time and never modified
 * afterwards.
 */

#pragma once

#include "core/plugin/PluginResult.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace journal::core {

/**
 * @brief Host resources a plugin may request access to.
 */
enum class Permission : int {
    ReadExperiences = 0,   ///< Read the user's experience records
    WriteExperiences = 1,  ///< Add experience records
    ReadSubstances = 2,    ///< Read the substance catalogue
    NetworkAccess = 3,     ///< Reach the network
    FileSystemAccess = 4,  ///< Touch files outside the plugin's data directory
    BiometricData = 5,     ///< Read biometric data
    ExportData = 6,        ///< Export records
    ImportData = 7,        ///< Import records
    SendNotifications = 8, ///< Post notifications to the user
    AnalyticsAccess = 9    ///< Take part in analytics dispatch
};

/**
 * @brief Converts a permission to its manifest string (e.g. "read-experiences").
 * @param permission The permission to convert.
 * @return Kebab-case permission name.
 */
std::string permissionToString(Permission permission);

/**
 * @brief Parses a manifest permission string.
 * @param str Kebab-case permission name.
 * @return The permission, or nullopt if the string is not a known permission.
 */
std::optional<Permission> permissionFromString(const std::string& str);

/**
 * @brief Checks that an id is usable as a single path component.
 *
 * Ids name the package file, the module cache and the data directory, so
 * only ASCII letters, digits, '.', '_' and '-' are accepted, and the id may
 * not start with '.'.
 */
bool isValidPluginId(const std::string& id);

/**
 * @brief Immutable identity record of a plugin package.
 */
struct PluginManifest {
    std::string id;                        ///< Unique, stable plugin identifier
    std::string name;                      ///< Human-readable plugin name
    std::string version;                   ///< Semantic version string
    std::string description;               ///< Plugin description
    std::string author;                    ///< Plugin author
    std::set<Permission> permissions;      ///< Requested permissions
    std::string entryPoint;                ///< Locator of the implementation
    std::vector<std::string> dependencies; ///< Other plugin ids (not enforced)

    /**
     * @brief Gets the fully qualified plugin identifier.
     * @return String in format "id@version".
     */
    [[nodiscard]] std::string fullId() const {
        return id + "@" + version;
    }

    /**
     * @brief Checks whether the manifest requests a permission.
     * @param permission The permission to check.
     * @return True if requested.
     */
    [[nodiscard]] bool hasPermission(Permission permission) const {
        return permissions.count(permission) > 0;
    }

    /**
     * @brief Checks that id, name, version and entryPoint are non-blank.
     * @return Empty result on success, ManifestInvalid naming the first bad field otherwise.
     */
    [[nodiscard]] PluginResult<void> validate() const;

    /**
     * @brief Serializes the manifest to its plugin.json form.
     * @return JSON representation of the manifest.
     */
    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Parses and validates a manifest from its plugin.json form.
     * @param j The JSON object to parse.
     * @return The manifest, or ManifestInvalid on wrong types, unknown permissions or blank fields.
     */
    static PluginResult<PluginManifest> fromJson(const nlohmann::json& j);

    bool operator==(const PluginManifest& other) const = default;
};

/**
 * @brief Runtime projection of a catalogue entry.
 *
 * isLoaded is true only while the manager holds a live instance; isEnabled is
 * the persisted user choice and is independent of load success.
 */
struct PluginInfo {
    PluginManifest manifest;
    bool isEnabled{false};
    bool isLoaded{false};
    std::optional<std::string> error;
};

} // namespace journal::core

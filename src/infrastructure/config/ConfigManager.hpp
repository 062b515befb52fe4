#pragma once

#include "infrastructure/plugin/PluginManager.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace journal::infra {

/**
 * @brief Application configuration settings.
 *
 * Empty paths select a default under the configuration directory.
 */
struct AppConfig {
    // Plugin host
    std::string pluginDirectory;         ///< Installed packages; default <configDir>/plugins.
    std::string dataDirectory;           ///< Plugin data and module cache; default <configDir>/data.
    int loadTimeoutMs{2000};             ///< Upper bound on reading one package.
    int analyzerTimeoutMs{5000};         ///< Upper bound on one analytics pass.
    bool enforcePermissions{true};       ///< Check manifest permissions on context calls.
    bool autoLoadEnabled{true};          ///< Load enabled plugins at startup.

    // Logging
    std::string logLevel{"info"};        ///< spdlog level name.
    std::string logFile;                 ///< Rotating log file; empty logs to the console only.

    // Preferences
    std::string preferencesFile;         ///< Default <configDir>/preferences.json.
};

/**
 * @brief Reads and writes the host's config.json.
 *
 * Relative paths in the file resolve against the configuration directory.
 */
class ConfigManager {
public:
    /// Creates @p configDir if it does not exist yet.
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults if the file is missing.
     * @return True if loaded successfully, false otherwise.
     */
    bool load();

    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    std::filesystem::path configPath() const { return configPath_; }

    std::filesystem::path pluginDir() const;
    std::filesystem::path dataDir() const;
    std::filesystem::path preferencesPath() const;

    /**
     * @brief Builds the plugin manager settings from the configuration.
     * @param appVersion Application version reported to plugins.
     * @return Manager settings with resolved directories and timeouts.
     */
    PluginManagerConfig pluginManagerConfig(const std::string& appVersion) const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);
    std::filesystem::path resolve(const std::string& configured, const std::string& fallback) const;

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace journal::infra

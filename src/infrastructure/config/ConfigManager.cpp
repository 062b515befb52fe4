#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace journal::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    std::error_code ec;
    if (!std::filesystem::exists(configDir_, ec)) {
        std::filesystem::create_directories(configDir_, ec);
        if (ec) {
            spdlog::error("Failed to create config directory {}: {}", configDir_.string(), ec.message());
        }
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Plugin host
    j["plugins"]["directory"] = config_.pluginDirectory;
    j["plugins"]["data_directory"] = config_.dataDirectory;
    j["plugins"]["load_timeout_ms"] = config_.loadTimeoutMs;
    j["plugins"]["analyzer_timeout_ms"] = config_.analyzerTimeoutMs;
    j["plugins"]["enforce_permissions"] = config_.enforcePermissions;
    j["plugins"]["auto_load_enabled"] = config_.autoLoadEnabled;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    // Preferences
    j["preferences"]["file"] = config_.preferencesFile;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    if (j.contains("plugins")) {
        const auto& p = j["plugins"];
        config_.pluginDirectory = p.value("directory", "");
        config_.dataDirectory = p.value("data_directory", "");
        config_.loadTimeoutMs = p.value("load_timeout_ms", 2000);
        config_.analyzerTimeoutMs = p.value("analyzer_timeout_ms", 5000);
        config_.enforcePermissions = p.value("enforce_permissions", true);
        config_.autoLoadEnabled = p.value("auto_load_enabled", true);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", "info");
        config_.logFile = l.value("file", "");
    }

    if (j.contains("preferences")) {
        config_.preferencesFile = j["preferences"].value("file", "");
    }

    if (config_.loadTimeoutMs <= 0) {
        spdlog::warn("Invalid plugins.load_timeout_ms {}, using 2000", config_.loadTimeoutMs);
        config_.loadTimeoutMs = 2000;
    }
    if (config_.analyzerTimeoutMs <= 0) {
        spdlog::warn("Invalid plugins.analyzer_timeout_ms {}, using 5000", config_.analyzerTimeoutMs);
        config_.analyzerTimeoutMs = 5000;
    }
}

std::filesystem::path ConfigManager::resolve(const std::string& configured, const std::string& fallback) const {
    if (configured.empty()) {
        return configDir_ / fallback;
    }
    std::filesystem::path path(configured);
    return path.is_absolute() ? path : configDir_ / path;
}

std::filesystem::path ConfigManager::pluginDir() const {
    return resolve(config_.pluginDirectory, "plugins");
}

std::filesystem::path ConfigManager::dataDir() const {
    return resolve(config_.dataDirectory, "data");
}

std::filesystem::path ConfigManager::preferencesPath() const {
    return resolve(config_.preferencesFile, "preferences.json");
}

PluginManagerConfig ConfigManager::pluginManagerConfig(const std::string& appVersion) const {
    PluginManagerConfig managerConfig;
    managerConfig.pluginDir = pluginDir();
    managerConfig.dataDir = dataDir();
    managerConfig.appVersion = appVersion;
    managerConfig.loadTimeout = std::chrono::milliseconds(config_.loadTimeoutMs);
    managerConfig.analyzerTimeout = std::chrono::milliseconds(config_.analyzerTimeoutMs);
    managerConfig.enforcePermissions = config_.enforcePermissions;
    return managerConfig;
}

} // namespace journal::infra

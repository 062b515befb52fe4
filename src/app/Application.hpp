#pragma once

#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/notifications/LogNotificationService.hpp"
#include "infrastructure/plugin/BuiltinPluginRegistry.hpp"
#include "infrastructure/plugin/PluginManager.hpp"
#include "infrastructure/preferences/JsonPreferenceStore.hpp"
#include "infrastructure/records/InMemoryJournalRepository.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace journal::app {

/**
 * @brief Command-line host for the plugin system.
 *
 * Wires configuration, logging, host services and the plugin manager, then
 * runs one command against them.
 */
class Application {
public:
    static constexpr const char* kVersion = "1.0.0";

    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    /**
     * @brief Runs a command.
     * @param command Command name ("list", "pack", "install", ...).
     * @param args Command arguments.
     * @return Process exit code.
     */
    int run(const std::string& command, const std::vector<std::string>& args);

    static void printUsage();

    infra::ConfigManager& config() { return *config_; }
    infra::PluginManager& pluginManager() { return *pluginManager_; }

private:
    void initializeLogging();
    void initializeComponents();

    int listPlugins();
    int packPlugin(const std::vector<std::string>& args);
    int installPlugin(const std::vector<std::string>& args);
    int uninstallPlugin(const std::vector<std::string>& args);
    int setPluginEnabled(const std::vector<std::string>& args, bool enabled);
    int analyze(const std::vector<std::string>& args);

    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::JsonPreferenceStore> preferences_;
    std::shared_ptr<infra::InMemoryJournalRepository> records_;
    std::shared_ptr<infra::LogNotificationService> notifications_;
    std::shared_ptr<infra::BuiltinPluginRegistry> builtins_;
    std::unique_ptr<infra::PluginManager> pluginManager_;
};

} // namespace journal::app

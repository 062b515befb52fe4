#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace journal::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "journal_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "journal_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));
        REQUIRE(manager.configPath() == tempPath / "config.json");

        std::filesystem::remove_all(tempPath);
    }
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Missing file writes defaults") {
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());

        REQUIRE(std::filesystem::exists(manager.configPath()));
        const auto& config = manager.config();
        REQUIRE(config.loadTimeoutMs == 2000);
        REQUIRE(config.analyzerTimeoutMs == 5000);
        REQUIRE(config.enforcePermissions);
        REQUIRE(config.autoLoadEnabled);
        REQUIRE(config.logLevel == "info");
    }

    SECTION("Saved values are loaded back") {
        {
            ConfigManager manager(testDir.path());
            manager.config().loadTimeoutMs = 750;
            manager.config().analyzerTimeoutMs = 1500;
            manager.config().enforcePermissions = false;
            manager.config().logLevel = "debug";
            manager.config().pluginDirectory = "/opt/journal/plugins";
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().loadTimeoutMs == 750);
        REQUIRE(reloaded.config().analyzerTimeoutMs == 1500);
        REQUIRE_FALSE(reloaded.config().enforcePermissions);
        REQUIRE(reloaded.config().logLevel == "debug");
        REQUIRE(reloaded.pluginDir() == std::filesystem::path("/opt/journal/plugins"));
    }

    SECTION("Invalid timeouts fall back to defaults") {
        std::ofstream(testDir.path() / "config.json")
            << R"({"plugins": {"load_timeout_ms": 0, "analyzer_timeout_ms": -5}})";

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        REQUIRE(manager.config().loadTimeoutMs == 2000);
        REQUIRE(manager.config().analyzerTimeoutMs == 5000);
    }

    SECTION("Malformed file fails to load") {
        std::ofstream(testDir.path() / "config.json") << "{ broken";

        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(manager.load());
    }
}

TEST_CASE("ConfigManager paths", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Defaults live under the config directory") {
        REQUIRE(manager.pluginDir() == testDir.path() / "plugins");
        REQUIRE(manager.dataDir() == testDir.path() / "data");
        REQUIRE(manager.preferencesPath() == testDir.path() / "preferences.json");
    }

    SECTION("Relative paths resolve against the config directory") {
        manager.config().dataDirectory = "state";

        REQUIRE(manager.dataDir() == testDir.path() / "state");
    }

    SECTION("Plugin manager settings") {
        manager.config().loadTimeoutMs = 300;
        manager.config().analyzerTimeoutMs = 400;

        auto pluginConfig = manager.pluginManagerConfig("9.9.9");

        REQUIRE(pluginConfig.pluginDir == testDir.path() / "plugins");
        REQUIRE(pluginConfig.dataDir == testDir.path() / "data");
        REQUIRE(pluginConfig.appVersion == "9.9.9");
        REQUIRE(pluginConfig.loadTimeout == std::chrono::milliseconds(300));
        REQUIRE(pluginConfig.analyzerTimeout == std::chrono::milliseconds(400));
        REQUIRE(pluginConfig.enforcePermissions);
    }
}

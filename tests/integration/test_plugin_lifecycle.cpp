#include <catch2/catch_test_macros.hpp>

#include "infrastructure/notifications/LogNotificationService.hpp"
#include "infrastructure/plugin/PluginManager.hpp"
#include "infrastructure/preferences/JsonPreferenceStore.hpp"
#include "infrastructure/records/InMemoryJournalRepository.hpp"
#include "pattern_recognition/PatternRecognitionPlugin.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace journal::core;
using namespace journal::infra;
using namespace journal::plugins;

namespace {

class IntegrationTestHost {
public:
    IntegrationTestHost()
        : root_(std::filesystem::temp_directory_path() / "journal_lifecycle_integration_test") {
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);

        preferences = std::make_shared<JsonPreferenceStore>(root_ / "preferences.json");
        records = std::make_shared<InMemoryJournalRepository>(lsdHistory(), std::vector<Substance>{});
        notifications = std::make_shared<LogNotificationService>();

        builtins = std::make_shared<BuiltinPluginRegistry>();
        builtins->registerFactory(PatternRecognitionPlugin::kBuiltinName, []() {
            return std::make_unique<PatternRecognitionPlugin>();
        });
    }

    ~IntegrationTestHost() {
        std::filesystem::remove_all(root_);
    }

    PluginManagerConfig config() const {
        PluginManagerConfig config;
        config.pluginDir = root_ / "plugins";
        config.dataDir = root_ / "data";
        config.appVersion = "1.0.0";
        return config;
    }

    PluginHostServices services() const {
        return PluginHostServices{records, preferences, notifications};
    }

    std::unique_ptr<PluginManager> makeManager(bool withBuiltins = true) const {
        return std::make_unique<PluginManager>(config(), services(), withBuiltins ? builtins : nullptr);
    }

    AnalyticsContext context() const {
        AnalyticsContext context;
        context.experiences = records->getExperiences();
        context.substances = records->getSubstances();
        return context;
    }

    std::filesystem::path root() const { return root_; }

    std::shared_ptr<JsonPreferenceStore> preferences;
    std::shared_ptr<InMemoryJournalRepository> records;
    std::shared_ptr<LogNotificationService> notifications;
    std::shared_ptr<BuiltinPluginRegistry> builtins;

private:
    static std::vector<Experience> lsdHistory() {
        std::vector<Experience> experiences;
        for (int i = 0; i < 3; ++i) {
            Experience experience;
            experience.title = "Session " + std::to_string(i + 1);
            experience.date = fromEpochMillis(1700000000000 + int64_t{i} * 5 * 86400000);
            experience.overallRating = 4;

            Ingestion ingestion;
            ingestion.substanceName = "LSD";
            ingestion.time = *experience.date;
            ingestion.dose = 100.0;
            ingestion.units = "ug";
            experience.ingestions.push_back(ingestion);

            experiences.push_back(experience);
        }
        return experiences;
    }

    std::filesystem::path root_;
};

bool hasInsight(const AnalyticsResult& result, const std::string& id) {
    return std::any_of(result.insights.begin(), result.insights.end(),
        [&id](const Insight& insight) { return insight.id == id; });
}

} // namespace

// =============================================================================
// Plugin Lifecycle Integration Tests
// =============================================================================

TEST_CASE("Plugin lifecycle - builtin plugin survives a restart",
          "[Integration][Plugin][Lifecycle]") {
    IntegrationTestHost host;
    auto bytes = PluginPackage::create(PatternRecognitionPlugin::makeManifest()).serialize();

    {
        auto manager = host.makeManager();
        manager->start();

        auto installed = manager->install(bytes);
        REQUIRE(installed);
        REQUIRE(manager->getCapabilities(CapabilityKind::Analytics).size() == 5);
    }

    SECTION("A new manager over the same store loads and runs the plugin") {
        auto manager = host.makeManager();
        manager->start();

        REQUIRE(manager->isLoaded(PatternRecognitionPlugin::kPluginId));

        auto batch = manager->executeAnalytics(host.context());

        REQUIRE(batch.failures.empty());
        REQUIRE(batch.results.size() == 5);

        auto combined = batch.combined();
        REQUIRE(hasInsight(combined, "frequent-use-LSD"));
        REQUIRE(hasInsight(combined, "insufficient-data"));
        REQUIRE(combined.riskAssessment.has_value());
        REQUIRE(combined.visualizations.size() == 4);

        auto plugin = std::dynamic_pointer_cast<PatternRecognitionPlugin>(
            manager->getPlugin(PatternRecognitionPlugin::kPluginId));
        REQUIRE(plugin != nullptr);
        REQUIRE(plugin->analysesRun() == 5);
        REQUIRE(plugin->statusMessage() == "Running - 5 analyses");
    }

    SECTION("A disabled plugin stays off across restarts") {
        {
            auto manager = host.makeManager();
            manager->start();
            REQUIRE(manager->disable(PatternRecognitionPlugin::kPluginId));
        }

        auto manager = host.makeManager();
        manager->start();

        REQUIRE_FALSE(manager->isLoaded(PatternRecognitionPlugin::kPluginId));
        REQUIRE(manager->executeAnalytics(host.context()).results.empty());
    }

    SECTION("Uninstall removes every trace") {
        auto manager = host.makeManager();
        manager->start();

        REQUIRE(manager->uninstall(PatternRecognitionPlugin::kPluginId));

        REQUIRE(manager->installedPlugins().empty());
        REQUIRE(manager->store().listPackages().empty());

        auto restarted = host.makeManager();
        restarted->start();
        REQUIRE(restarted->installedPlugins().empty());
    }

    SECTION("Without the builtin registered the plugin reports an error") {
        auto manager = host.makeManager(false);
        manager->start();

        auto info = manager->pluginInfo(PatternRecognitionPlugin::kPluginId);
        REQUIRE(info.has_value());
        REQUIRE(info->isEnabled);
        REQUIRE_FALSE(info->isLoaded);
        REQUIRE(info->error.has_value());
    }
}

TEST_CASE("Plugin lifecycle - shared library module",
          "[Integration][Plugin][Lifecycle]") {
    IntegrationTestHost host;

    std::filesystem::path modulePath(JOURNAL_PATTERN_MODULE);
    std::ifstream file(modulePath, std::ios::binary);
    REQUIRE(file);
    Bytes module((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    auto moduleName = modulePath.filename().string();
    auto manifest = PatternRecognitionPlugin::makeManifest(moduleName);
    auto bytes = PluginPackage::create(manifest, {{moduleName, module}}).serialize();

    auto manager = host.makeManager(false);
    manager->start();

    SECTION("Installs, analyzes and uninstalls through the module entry points") {
        auto installed = manager->install(bytes);
        REQUIRE(installed);
        REQUIRE(installed.value()->manifest().id == PatternRecognitionPlugin::kPluginId);

        auto extracted = manager->store().moduleDir() / PatternRecognitionPlugin::kPluginId / moduleName;
        REQUIRE(std::filesystem::exists(extracted));

        auto batch = manager->executeAnalytics(host.context());
        REQUIRE(batch.failures.empty());
        REQUIRE(batch.results.size() == 5);
        REQUIRE(hasInsight(batch.combined(), "frequent-use-LSD"));

        REQUIRE(manager->uninstall(PatternRecognitionPlugin::kPluginId));
        REQUIRE_FALSE(std::filesystem::exists(extracted.parent_path()));
    }

    SECTION("Reinstall replaces the module") {
        REQUIRE(manager->install(bytes));
        REQUIRE(manager->install(bytes));

        REQUIRE(manager->getLoadedPluginIds().size() == 1);
        REQUIRE(manager->executeAnalytics(host.context()).results.size() == 5);
    }
}

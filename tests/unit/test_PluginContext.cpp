#include <catch2/catch_test_macros.hpp>

#include "infrastructure/notifications/LogNotificationService.hpp"
#include "infrastructure/plugin/PluginContext.hpp"
#include "infrastructure/preferences/JsonPreferenceStore.hpp"
#include "infrastructure/records/InMemoryJournalRepository.hpp"

#include <filesystem>

using namespace journal::core;
using namespace journal::infra;

namespace {

class TestDataDir {
public:
    TestDataDir()
        : dataDir_(std::filesystem::temp_directory_path() / "journal_context_test") {
        cleanup();
    }

    ~TestDataDir() { cleanup(); }

    std::filesystem::path path() const { return dataDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(dataDir_)) {
            std::filesystem::remove_all(dataDir_);
        }
    }

    std::filesystem::path dataDir_;
};

PluginManifest manifestWith(std::set<Permission> permissions) {
    PluginManifest manifest;
    manifest.id = "com.test.context";
    manifest.name = "Context Test";
    manifest.version = "1.0.0";
    manifest.entryPoint = "builtin:context";
    manifest.permissions = std::move(permissions);
    return manifest;
}

Experience sampleExperience(const std::string& title) {
    Experience experience;
    experience.title = title;
    experience.overallRating = 4;
    return experience;
}

} // namespace

TEST_CASE("PluginContext record access", "[PluginContext]") {
    TestDataDir dir;
    auto records = std::make_shared<InMemoryJournalRepository>(
        std::vector<Experience>{sampleExperience("first")},
        std::vector<Substance>{Substance{"LSD", {"Acid"}, {"psychedelic"}, {}}});
    PluginHostServices services{records, nullptr, nullptr};

    SECTION("Reads are allowed with the matching permissions") {
        PluginContext context(manifestWith({Permission::ReadExperiences, Permission::ReadSubstances}),
            services, dir.path().string(), "1.0.0");

        auto experiences = context.readExperiences();
        auto substances = context.readSubstances();

        REQUIRE(experiences);
        REQUIRE(experiences.value().size() == 1);
        REQUIRE(substances);
        REQUIRE(substances.value().front().name == "LSD");
    }

    SECTION("Reads are denied without permissions") {
        PluginContext context(manifestWith({}), services, dir.path().string(), "1.0.0");

        auto experiences = context.readExperiences();
        auto substances = context.readSubstances();

        REQUIRE_FALSE(experiences);
        REQUIRE(experiences.error().code == PluginErrorCode::PermissionDenied);
        REQUIRE_FALSE(substances);
        REQUIRE(substances.error().code == PluginErrorCode::PermissionDenied);
    }

    SECTION("Writes need write-experiences") {
        PluginContext readOnly(manifestWith({Permission::ReadExperiences}),
            services, dir.path().string(), "1.0.0");
        PluginContext writer(manifestWith({Permission::WriteExperiences}),
            services, dir.path().string(), "1.0.0");

        auto denied = readOnly.addExperience(sampleExperience("denied"));
        REQUIRE_FALSE(denied);
        REQUIRE(denied.error().code == PluginErrorCode::PermissionDenied);
        REQUIRE(records->getExperiences().size() == 1);

        auto added = writer.addExperience(sampleExperience("second"));
        REQUIRE(added);
        REQUIRE(added.value() > 0);
        REQUIRE(records->getExperiences().size() == 2);
    }

    SECTION("Permission checks can be turned off") {
        PluginContext context(manifestWith({}), services, dir.path().string(), "1.0.0", false);

        REQUIRE(context.hasPermission(Permission::ReadExperiences));
        REQUIRE(context.readExperiences());
    }

    SECTION("Missing record store reads as empty") {
        PluginContext context(manifestWith({Permission::ReadExperiences, Permission::WriteExperiences}),
            PluginHostServices{}, dir.path().string(), "1.0.0");

        auto experiences = context.readExperiences();
        REQUIRE(experiences);
        REQUIRE(experiences.value().empty());

        auto added = context.addExperience(sampleExperience("nowhere"));
        REQUIRE_FALSE(added);
        REQUIRE(added.error().code == PluginErrorCode::StoreWriteFailed);
    }
}

TEST_CASE("PluginContext notifications", "[PluginContext]") {
    TestDataDir dir;
    auto notifications = std::make_shared<LogNotificationService>();
    PluginHostServices services{nullptr, nullptr, notifications};

    SECTION("Posts with send-notifications") {
        PluginContext context(manifestWith({Permission::SendNotifications}),
            services, dir.path().string(), "1.0.0");

        REQUIRE(context.showNotification("Title", "Body", NotificationSeverity::Warning));

        auto history = notifications->history();
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].source == "com.test.context");
        REQUIRE(history[0].title == "Title");
        REQUIRE(history[0].severity == NotificationSeverity::Warning);
    }

    SECTION("Denied without send-notifications") {
        PluginContext context(manifestWith({}), services, dir.path().string(), "1.0.0");

        auto result = context.showNotification("Title", "Body", NotificationSeverity::Info);

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::PermissionDenied);
        REQUIRE(notifications->history().empty());
    }
}

TEST_CASE("PluginContext preferences and environment", "[PluginContext]") {
    TestDataDir dir;
    auto preferences = std::make_shared<JsonPreferenceStore>();
    PluginHostServices services{nullptr, preferences, nullptr};
    PluginContext context(manifestWith({}), services, (dir.path() / "data").string(), "2.3.4");

    SECTION("Preferences are namespaced by plugin id") {
        REQUIRE(context.setPreference("threshold", "5"));

        REQUIRE(context.getPreference("threshold") == "5");
        REQUIRE(preferences->get("plugin_pref_com.test.context.threshold") == std::optional<std::string>("5"));
        REQUIRE(context.getPreference("missing", "fallback") == "fallback");
    }

    SECTION("Bool preferences") {
        REQUIRE(context.setBoolPreference("verbose", true));
        REQUIRE(context.getBoolPreference("verbose"));
        REQUIRE_FALSE(context.getBoolPreference("unset"));
    }

    SECTION("Data directory is created") {
        REQUIRE(std::filesystem::is_directory(context.dataDir()));
    }

    SECTION("Exposes id and host version") {
        REQUIRE(context.pluginId() == "com.test.context");
        REQUIRE(context.appVersion() == "2.3.4");
    }

    SECTION("Without a preference store settings are not persisted") {
        PluginContext bare(manifestWith({}), PluginHostServices{}, (dir.path() / "bare").string(), "1.0.0");

        REQUIRE_FALSE(bare.setPreference("key", "value"));
        REQUIRE(bare.getPreference("key", "default") == "default");
    }
}

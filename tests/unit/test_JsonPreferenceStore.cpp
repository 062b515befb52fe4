#include <catch2/catch_test_macros.hpp>

#include "infrastructure/preferences/JsonPreferenceStore.hpp"

#include <filesystem>
#include <fstream>

using namespace journal::infra;

namespace {

class TestPreferencesDir {
public:
    TestPreferencesDir()
        : dir_(std::filesystem::temp_directory_path() / "journal_preferences_test") {
        cleanup();
        std::filesystem::create_directories(dir_);
    }

    ~TestPreferencesDir() { cleanup(); }

    std::filesystem::path file() const { return dir_ / "preferences.json"; }

private:
    void cleanup() {
        if (std::filesystem::exists(dir_)) {
            std::filesystem::remove_all(dir_);
        }
    }

    std::filesystem::path dir_;
};

} // namespace

TEST_CASE("JsonPreferenceStore in memory", "[JsonPreferenceStore]") {
    JsonPreferenceStore store;

    SECTION("Unset keys are empty") {
        REQUIRE_FALSE(store.get("missing").has_value());
        REQUIRE(store.getString("missing", "default") == "default");
        REQUIRE(store.getBool("missing", true));
    }

    SECTION("Set and get") {
        REQUIRE(store.set("key", "value"));
        REQUIRE(store.get("key") == std::optional<std::string>("value"));
        REQUIRE(store.size() == 1);
    }

    SECTION("Bool values") {
        REQUIRE(store.setBool("flag", true));
        REQUIRE(store.getBool("flag"));
        REQUIRE(store.setBool("flag", false));
        REQUIRE_FALSE(store.getBool("flag", true));
    }

    SECTION("Remove") {
        REQUIRE(store.set("key", "value"));
        REQUIRE(store.remove("key"));
        REQUIRE_FALSE(store.get("key").has_value());
        REQUIRE(store.remove("key"));
    }

    SECTION("Remove by prefix") {
        REQUIRE(store.set("plugin_pref_com.a.mode", "fast"));
        REQUIRE(store.set("plugin_pref_com.a.limit", "3"));
        REQUIRE(store.set("plugin_pref_com.ab.mode", "slow"));
        REQUIRE(store.set("plugin_enabled_com.a", "true"));

        REQUIRE(store.removePrefix("plugin_pref_com.a."));

        REQUIRE_FALSE(store.get("plugin_pref_com.a.mode").has_value());
        REQUIRE_FALSE(store.get("plugin_pref_com.a.limit").has_value());
        REQUIRE(store.getString("plugin_pref_com.ab.mode") == "slow");
        REQUIRE(store.getBool("plugin_enabled_com.a"));
        REQUIRE(store.removePrefix("nothing."));
    }
}

TEST_CASE("JsonPreferenceStore persistence", "[JsonPreferenceStore]") {
    TestPreferencesDir dir;

    SECTION("Values survive a new store instance") {
        {
            JsonPreferenceStore store(dir.file());
            REQUIRE(store.set("plugin_enabled_a", "true"));
            REQUIRE(store.set("plugin_pref_a.mode", "fast"));
        }

        JsonPreferenceStore reopened(dir.file());
        REQUIRE(reopened.getBool("plugin_enabled_a"));
        REQUIRE(reopened.getString("plugin_pref_a.mode") == "fast");
    }

    SECTION("Removed values stay removed") {
        {
            JsonPreferenceStore store(dir.file());
            REQUIRE(store.set("key", "value"));
            REQUIRE(store.remove("key"));
        }

        JsonPreferenceStore reopened(dir.file());
        REQUIRE(reopened.size() == 0);
    }

    SECTION("Prefix removal is persisted") {
        {
            JsonPreferenceStore store(dir.file());
            REQUIRE(store.set("plugin_pref_a.mode", "fast"));
            REQUIRE(store.set("plugin_pref_b.mode", "slow"));
            REQUIRE(store.removePrefix("plugin_pref_a."));
        }

        JsonPreferenceStore reopened(dir.file());
        REQUIRE(reopened.size() == 1);
        REQUIRE(reopened.getString("plugin_pref_b.mode") == "slow");
    }

    SECTION("Non-string values are kept as JSON text") {
        std::ofstream(dir.file()) << R"({"count": 3, "name": "x"})";

        JsonPreferenceStore store(dir.file());

        REQUIRE(store.getString("count") == "3");
        REQUIRE(store.getString("name") == "x");
    }

    SECTION("Corrupt file starts empty") {
        std::ofstream(dir.file()) << "{ not json";

        JsonPreferenceStore store(dir.file());

        REQUIRE(store.size() == 0);
        REQUIRE(store.set("key", "value"));
        REQUIRE(JsonPreferenceStore(dir.file()).getString("key") == "value");
    }
}

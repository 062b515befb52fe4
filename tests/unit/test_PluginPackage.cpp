#include <catch2/catch_test_macros.hpp>

#include "infrastructure/plugin/PluginPackage.hpp"

using namespace journal::core;
using namespace journal::infra;

namespace {

PluginManifest testManifest() {
    PluginManifest manifest;
    manifest.id = "com.test.package";
    manifest.name = "Package Test";
    manifest.version = "2.0.0";
    manifest.author = "Test";
    manifest.entryPoint = "libtest.so";
    manifest.permissions = {Permission::ReadExperiences};
    return manifest;
}

Bytes documentBytes(const nlohmann::json& document) {
    return nlohmann::json::to_cbor(document);
}

Bytes textBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace

TEST_CASE("PluginPackage create and parse", "[PluginPackage]") {
    SECTION("Manifest and modules survive serialization") {
        Bytes module{0x7f, 'E', 'L', 'F', 0x00, 0x01};
        auto package = PluginPackage::create(testManifest(), {{"libtest.so", module}});

        auto parsed = PluginPackage::parse(package.serialize());

        REQUIRE(parsed);
        REQUIRE(parsed.value().manifest() == testManifest());
        REQUIRE(parsed.value().moduleNames() == std::vector<std::string>{"libtest.so"});
        REQUIRE(parsed.value().entry("libtest.so") != nullptr);
        REQUIRE(*parsed.value().entry("libtest.so") == module);
    }

    SECTION("Manifest entry is not listed as a module") {
        auto package = PluginPackage::create(testManifest());

        auto parsed = PluginPackage::parse(package.serialize());

        REQUIRE(parsed);
        REQUIRE(parsed.value().moduleNames().empty());
        REQUIRE(parsed.value().entry(PluginPackage::kManifestEntry) == nullptr);
    }
}

TEST_CASE("PluginPackage rejects malformed input", "[PluginPackage]") {
    SECTION("Random bytes are corrupt") {
        auto result = PluginPackage::parse(textBytes("definitely not a package"));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::PackageCorrupt);
    }

    SECTION("Empty input is corrupt") {
        auto result = PluginPackage::parse({});

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::PackageCorrupt);
    }

    SECTION("Missing format marker is corrupt") {
        auto result = PluginPackage::parse(documentBytes({{"entries", nlohmann::json::object()}}));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::PackageCorrupt);
    }

    SECTION("Unsupported format version is corrupt") {
        auto result = PluginPackage::parse(documentBytes({
            {"format", PluginPackage::kFormat},
            {"formatVersion", 99},
            {"entries", nlohmann::json::object()}
        }));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::PackageCorrupt);
    }

    SECTION("Missing manifest entry") {
        auto result = PluginPackage::parse(documentBytes({
            {"format", PluginPackage::kFormat},
            {"formatVersion", PluginPackage::kFormatVersion},
            {"entries", {{"libtest.so", nlohmann::json::binary(Bytes{1, 2, 3})}}}
        }));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::ManifestNotFound);
    }

    SECTION("Manifest that is not JSON") {
        auto result = PluginPackage::parse(documentBytes({
            {"format", PluginPackage::kFormat},
            {"formatVersion", PluginPackage::kFormatVersion},
            {"entries", {{PluginPackage::kManifestEntry, nlohmann::json::binary(textBytes("{not json"))}}}
        }));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::ManifestInvalid);
    }

    SECTION("Manifest with a blank id") {
        auto manifestJson = testManifest().toJson();
        manifestJson["id"] = "";

        auto result = PluginPackage::parse(documentBytes({
            {"format", PluginPackage::kFormat},
            {"formatVersion", PluginPackage::kFormatVersion},
            {"entries", {{PluginPackage::kManifestEntry,
                nlohmann::json::binary(textBytes(manifestJson.dump()))}}}
        }));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::ManifestInvalid);
    }

    SECTION("Entries that are not byte strings are corrupt") {
        auto result = PluginPackage::parse(documentBytes({
            {"format", PluginPackage::kFormat},
            {"formatVersion", PluginPackage::kFormatVersion},
            {"entries", {{PluginPackage::kManifestEntry, "plain string"}}}
        }));

        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == PluginErrorCode::PackageCorrupt);
    }
}

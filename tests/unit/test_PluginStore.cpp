#include <catch2/catch_test_macros.hpp>

#include "infrastructure/plugin/PluginStore.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

using namespace journal::core;
using namespace journal::infra;

namespace {

class TestStoreDir {
public:
    TestStoreDir()
        : root_(std::filesystem::temp_directory_path() / "journal_store_test") {
        cleanup();
        std::filesystem::create_directories(root_);
    }

    ~TestStoreDir() { cleanup(); }

    std::filesystem::path packages() const { return root_ / "plugins"; }
    std::filesystem::path modules() const { return root_ / "modules"; }
    std::filesystem::path root() const { return root_; }

private:
    void cleanup() {
        if (std::filesystem::exists(root_)) {
            std::filesystem::remove_all(root_);
        }
    }

    std::filesystem::path root_;
};

} // namespace

TEST_CASE("PluginStore writes and reads packages", "[PluginStore]") {
    TestStoreDir dir;
    PluginStore store(dir.packages(), dir.modules(), std::chrono::milliseconds(2000));

    SECTION("Constructor creates both directories") {
        REQUIRE(std::filesystem::is_directory(dir.packages()));
        REQUIRE(std::filesystem::is_directory(dir.modules()));
    }

    SECTION("Package path uses the plugin id") {
        REQUIRE(store.packagePath("com.test") == dir.packages() / "com.test.jpkg");
    }

    SECTION("Written bytes can be read back") {
        Bytes bytes{1, 2, 3, 4, 5};

        REQUIRE(store.write("com.test", bytes));
        REQUIRE(store.contains("com.test"));
        REQUIRE_FALSE(std::filesystem::exists(dir.packages() / "com.test.jpkg.tmp"));

        auto read = store.read(store.packagePath("com.test"));
        REQUIRE(read);
        REQUIRE(read.value() == bytes);
    }

    SECTION("Overwrite replaces the previous package") {
        REQUIRE(store.write("com.test", Bytes{1}));
        REQUIRE(store.write("com.test", Bytes{9, 9}));

        auto read = store.read(store.packagePath("com.test"));
        REQUIRE(read);
        REQUIRE(read.value() == Bytes{9, 9});
    }

    SECTION("Reading a missing file") {
        auto read = store.read(dir.packages() / "missing.jpkg");

        REQUIRE_FALSE(read);
        REQUIRE(read.error().code == PluginErrorCode::PluginNotFound);
    }

    SECTION("Listing returns only packages, sorted") {
        REQUIRE(store.write("b-plugin", Bytes{1}));
        REQUIRE(store.write("a-plugin", Bytes{1}));
        std::ofstream(dir.packages() / "notes.txt") << "ignored";

        auto packages = store.listPackages();

        REQUIRE(packages.size() == 2);
        REQUIRE(packages[0].filename() == "a-plugin.jpkg");
        REQUIRE(packages[1].filename() == "b-plugin.jpkg");
    }
}

TEST_CASE("PluginStore removal", "[PluginStore]") {
    TestStoreDir dir;
    PluginStore store(dir.packages(), dir.modules(), std::chrono::milliseconds(2000));

    SECTION("Remove deletes the package and its extracted modules") {
        REQUIRE(store.write("com.test", Bytes{1, 2}));
        auto module = store.extractModule("com.test", "libtest.so", Bytes{7, 7, 7});
        REQUIRE(module);
        REQUIRE(std::filesystem::exists(module.value()));

        REQUIRE(store.remove("com.test"));

        REQUIRE_FALSE(store.contains("com.test"));
        REQUIRE_FALSE(std::filesystem::exists(dir.modules() / "com.test"));
    }

    SECTION("Removing an unknown plugin succeeds") {
        REQUIRE(store.remove("never-installed"));
    }

    SECTION("Ids that are not plain file names are refused") {
        REQUIRE(store.write("com.victim", Bytes{1}));
        REQUIRE(store.extractModule("com.victim", "libvictim.so", Bytes{2}));

        for (const char* id : {"../plugins", "..", ".", "a/b", "..\\plugins", ""}) {
            auto removed = store.remove(id);

            REQUIRE_FALSE(removed);
            REQUIRE(removed.error().code == PluginErrorCode::ManifestInvalid);
        }

        REQUIRE(store.contains("com.victim"));
        REQUIRE(std::filesystem::exists(dir.modules() / "com.victim" / "libvictim.so"));

        auto written = store.write("../escape", Bytes{1});
        REQUIRE_FALSE(written);
        REQUIRE(written.error().code == PluginErrorCode::ManifestInvalid);
        REQUIRE_FALSE(std::filesystem::exists(dir.root() / "escape.jpkg"));
    }

    SECTION("Package files are deleted only inside the store") {
        REQUIRE(store.write("com.test", Bytes{1}));
        auto renamed = dir.packages() / "renamed.jpkg";
        std::filesystem::rename(store.packagePath("com.test"), renamed);
        auto outside = dir.root() / "outside.jpkg";
        std::ofstream(outside) << "keep";

        REQUIRE(store.holds(renamed));
        REQUIRE_FALSE(store.holds(outside));

        REQUIRE(store.removePackageFile(renamed));
        REQUIRE_FALSE(std::filesystem::exists(renamed));

        auto refused = store.removePackageFile(outside);
        REQUIRE_FALSE(refused);
        REQUIRE(refused.error().code == PluginErrorCode::StoreWriteFailed);
        REQUIRE(std::filesystem::exists(outside));
    }
}

TEST_CASE("PluginStore read timeout", "[PluginStore]") {
    TestStoreDir dir;
    PluginStore store(dir.packages(), dir.modules(), std::chrono::milliseconds(100));

    // Opening a FIFO for reading blocks until a writer shows up.
    auto fifo = dir.packages() / "stalled.jpkg";
    REQUIRE(::mkfifo(fifo.c_str(), 0600) == 0);

    auto start = std::chrono::steady_clock::now();
    auto read = store.read(fifo);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(read);
    REQUIRE(read.error().code == PluginErrorCode::LoadTimeout);
    REQUIRE(elapsed < std::chrono::seconds(2));

    // Release the reader thread before the directory goes away.
    std::ofstream(fifo).close();
}

TEST_CASE("PluginStore module extraction", "[PluginStore]") {
    TestStoreDir dir;
    PluginStore store(dir.packages(), dir.modules(), std::chrono::milliseconds(2000));

    SECTION("Extracts into a per-plugin directory") {
        auto module = store.extractModule("com.test", "libtest.so", Bytes{1, 2, 3});

        REQUIRE(module);
        REQUIRE(module.value() == dir.modules() / "com.test" / "libtest.so");
        REQUIRE(std::filesystem::file_size(module.value()) == 3);
    }

    SECTION("Rejects names that leave the module directory") {
        auto escaped = store.extractModule("com.test", "../../evil.so", Bytes{1});

        REQUIRE_FALSE(escaped);
        REQUIRE(escaped.error().code == PluginErrorCode::PackageCorrupt);
        REQUIRE_FALSE(std::filesystem::exists(dir.root() / "evil.so"));
    }

    SECTION("Rejects nested names") {
        auto nested = store.extractModule("com.test", "lib/test.so", Bytes{1});

        REQUIRE_FALSE(nested);
        REQUIRE(nested.error().code == PluginErrorCode::PackageCorrupt);
    }
}

#include "infrastructure/plugin/PluginStore.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>
#include <spdlog/spdlog.h>

namespace journal::infra {

using core::PluginErrorCode;
using core::PluginResult;

namespace {

std::optional<Bytes> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return bytes;
}

core::PluginError invalidId(const std::string& pluginId) {
    return core::PluginError{PluginErrorCode::ManifestInvalid,
        "Plugin id '" + pluginId + "' is not a valid file name"};
}

} // namespace

PluginStore::PluginStore(std::filesystem::path packageDir,
                         std::filesystem::path moduleDir,
                         std::chrono::milliseconds readTimeout)
    : packageDir_(std::move(packageDir))
    , moduleDir_(std::move(moduleDir))
    , readTimeout_(readTimeout) {

    std::error_code ec;
    std::filesystem::create_directories(packageDir_, ec);
    if (ec) {
        spdlog::error("Failed to create plugin directory {}: {}", packageDir_.string(), ec.message());
    }
    std::filesystem::create_directories(moduleDir_, ec);
    if (ec) {
        spdlog::error("Failed to create module cache {}: {}", moduleDir_.string(), ec.message());
    }
}

std::filesystem::path PluginStore::packagePath(const std::string& pluginId) const {
    return packageDir_ / (pluginId + PluginPackage::kFileExtension);
}

PluginResult<void> PluginStore::write(const std::string& pluginId, const Bytes& bytes) {
    if (!core::isValidPluginId(pluginId)) {
        return PluginResult<void>::err(invalidId(pluginId));
    }
    auto path = packagePath(pluginId);
    if (!writeFileAtomically(path, bytes)) {
        return PluginResult<void>::err(PluginErrorCode::StoreWriteFailed,
            "Failed to write package " + path.string());
    }
    spdlog::debug("Stored plugin package: {}", path.string());
    return PluginResult<void>::ok();
}

PluginResult<void> PluginStore::remove(const std::string& pluginId) {
    if (!core::isValidPluginId(pluginId)) {
        return PluginResult<void>::err(invalidId(pluginId));
    }

    std::error_code ec;
    auto path = packagePath(pluginId);
    std::filesystem::remove(path, ec);
    if (ec) {
        return PluginResult<void>::err(PluginErrorCode::StoreWriteFailed,
            "Failed to delete package " + path.string() + ": " + ec.message());
    }

    auto modules = moduleDir_ / pluginId;
    std::filesystem::remove_all(modules, ec);
    if (ec) {
        return PluginResult<void>::err(PluginErrorCode::StoreWriteFailed,
            "Failed to delete module cache " + modules.string() + ": " + ec.message());
    }
    return PluginResult<void>::ok();
}

PluginResult<void> PluginStore::removePackageFile(const std::filesystem::path& path) {
    if (!holds(path)) {
        return PluginResult<void>::err(PluginErrorCode::StoreWriteFailed,
            "Refusing to delete " + path.string() + " outside " + packageDir_.string());
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return PluginResult<void>::err(PluginErrorCode::StoreWriteFailed,
            "Failed to delete package " + path.string() + ": " + ec.message());
    }
    return PluginResult<void>::ok();
}

bool PluginStore::holds(const std::filesystem::path& path) const {
    if (path.extension() != PluginPackage::kFileExtension) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::equivalent(path.parent_path(), packageDir_, ec);
}

bool PluginStore::contains(const std::string& pluginId) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(packagePath(pluginId), ec);
}

std::vector<std::filesystem::path> PluginStore::listPackages() const {
    std::vector<std::filesystem::path> packages;

    std::error_code ec;
    if (!std::filesystem::exists(packageDir_, ec)) {
        return packages;
    }

    for (const auto& entry : std::filesystem::directory_iterator(packageDir_, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (entry.path().extension() != PluginPackage::kFileExtension) {
            continue;
        }
        packages.push_back(entry.path());
    }
    if (ec) {
        spdlog::warn("Failed to scan plugin directory {}: {}", packageDir_.string(), ec.message());
    }

    std::sort(packages.begin(), packages.end());
    return packages;
}

PluginResult<Bytes> PluginStore::read(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || std::filesystem::is_directory(path, ec)) {
        return PluginResult<Bytes>::err(PluginErrorCode::PluginNotFound,
            "Package not found: " + path.string());
    }

    // The reader thread owns its task, so a stalled read outlives this call harmlessly.
    auto task = std::make_shared<std::packaged_task<std::optional<Bytes>()>>(
        [path]() { return readFile(path); });
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(readTimeout_) != std::future_status::ready) {
        spdlog::error("Reading package timed out after {} ms: {}", readTimeout_.count(), path.string());
        return PluginResult<Bytes>::err(PluginErrorCode::LoadTimeout,
            "Reading " + path.string() + " exceeded " + std::to_string(readTimeout_.count()) + " ms");
    }

    auto bytes = future.get();
    if (!bytes) {
        return PluginResult<Bytes>::err(PluginErrorCode::PackageCorrupt,
            "Failed to read package " + path.string());
    }
    return PluginResult<Bytes>::ok(std::move(*bytes));
}

PluginResult<std::filesystem::path> PluginStore::extractModule(const std::string& pluginId,
                                                               const std::string& name,
                                                               const Bytes& bytes) {
    if (!core::isValidPluginId(pluginId)) {
        return PluginResult<std::filesystem::path>::err(invalidId(pluginId));
    }

    auto fileName = std::filesystem::path(name).filename();
    if (fileName.empty() || fileName != std::filesystem::path(name)) {
        return PluginResult<std::filesystem::path>::err(PluginErrorCode::PackageCorrupt,
            "Module name must be a plain file name: " + name);
    }

    auto directory = moduleDir_ / pluginId;
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return PluginResult<std::filesystem::path>::err(PluginErrorCode::StoreWriteFailed,
            "Failed to create " + directory.string() + ": " + ec.message());
    }

    auto path = directory / fileName;
    if (!writeFileAtomically(path, bytes)) {
        return PluginResult<std::filesystem::path>::err(PluginErrorCode::StoreWriteFailed,
            "Failed to extract module " + path.string());
    }
    return PluginResult<std::filesystem::path>::ok(path);
}

bool PluginStore::writeFileAtomically(const std::filesystem::path& path, const Bytes& bytes) {
    auto temporary = path;
    temporary += ".tmp";

    {
        std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to open {} for writing", temporary.string());
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            spdlog::error("Failed to write {}", temporary.string());
            file.close();
            std::error_code ec;
            std::filesystem::remove(temporary, ec);
            return false;
        }
    }

    // A fresh inode on rename keeps an already-mapped module intact.
    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        spdlog::error("Failed to move {} into place: {}", temporary.string(), ec.message());
        std::filesystem::remove(temporary, ec);
        return false;
    }
    return true;
}

} // namespace journal::infra

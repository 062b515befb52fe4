/**
 * @file PluginStore.hpp
 * @brief On-disk storage of installed plugin packages.
 */

#pragma once

#include "core/plugin/PluginResult.hpp"
#include "infrastructure/plugin/PluginPackage.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace journal::infra {

/**
 * @brief Directory of installed packages, one "<id>.jpkg" file per plugin.
 *
 * Modules extracted from packages live under a separate cache directory,
 * one subdirectory per plugin id.
 */
class PluginStore {
public:
    /**
     * @brief Constructs a store and creates its directories.
     * @param packageDir Directory holding "<id>.jpkg" files.
     * @param moduleDir Directory holding extracted modules.
     * @param readTimeout Upper bound on reading one package.
     */
    PluginStore(std::filesystem::path packageDir,
                std::filesystem::path moduleDir,
                std::chrono::milliseconds readTimeout);

    [[nodiscard]] std::filesystem::path packagePath(const std::string& pluginId) const;

    /**
     * @brief Writes a package, replacing any previous one with the same id.
     * @param pluginId Plugin id, used as the file stem.
     * @param bytes Package contents.
     * @return Empty result, or StoreWriteFailed.
     */
    core::PluginResult<void> write(const std::string& pluginId, const Bytes& bytes);

    /**
     * @brief Deletes a package and its extracted modules.
     * @param pluginId Plugin id.
     * @return Empty result (also when nothing was stored), ManifestInvalid for
     *         an id that is not a plain file name, or StoreWriteFailed.
     */
    core::PluginResult<void> remove(const std::string& pluginId);

    /// Deletes one package file directly inside the package directory.
    core::PluginResult<void> removePackageFile(const std::filesystem::path& path);

    /// True if @p path names a package file directly inside the package directory.
    [[nodiscard]] bool holds(const std::filesystem::path& path) const;

    [[nodiscard]] bool contains(const std::string& pluginId) const;

    /**
     * @brief Lists stored package files.
     * @return Paths of "*.jpkg" files, sorted.
     */
    [[nodiscard]] std::vector<std::filesystem::path> listPackages() const;

    /**
     * @brief Reads a package file, giving up after the read timeout.
     * @param path Package file path.
     * @return Package bytes, or PluginNotFound, PackageCorrupt or LoadTimeout.
     */
    [[nodiscard]] core::PluginResult<Bytes> read(const std::filesystem::path& path) const;

    /**
     * @brief Writes a module to the cache so it can be opened as a shared library.
     * @param pluginId Owning plugin id.
     * @param name Module entry name.
     * @param bytes Module contents.
     * @return Path of the extracted module, or StoreWriteFailed.
     */
    core::PluginResult<std::filesystem::path> extractModule(const std::string& pluginId,
                                                            const std::string& name,
                                                            const Bytes& bytes);

    [[nodiscard]] const std::filesystem::path& packageDir() const { return packageDir_; }
    [[nodiscard]] const std::filesystem::path& moduleDir() const { return moduleDir_; }
    [[nodiscard]] std::chrono::milliseconds readTimeout() const { return readTimeout_; }

private:
    static bool writeFileAtomically(const std::filesystem::path& path, const Bytes& bytes);

    std::filesystem::path packageDir_;
    std::filesystem::path moduleDir_;
    std::chrono::milliseconds readTimeout_;
};

} // namespace journal::infra

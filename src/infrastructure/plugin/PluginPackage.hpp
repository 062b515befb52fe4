/**
 * @file PluginPackage.hpp
 * @brief Reading and writing plugin package archives.
 *
 * A package is a single CBOR document:
 * @code
 *   { "format": "journal-plugin", "formatVersion": 1,
 *     "entries": { "plugin.json": <bytes>, "<module>": <bytes>, ... } }
 * @endcode
 * The plugin.json entry holds the UTF-8 JSON manifest; every other entry is
 * an implementation module.
 */

#pragma once

#include "core/plugin/PluginManifest.hpp"
#include "core/plugin/PluginResult.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace journal::infra {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief An unpacked plugin package with a validated manifest.
 */
class PluginPackage {
public:
    static constexpr const char* kFormat = "journal-plugin";
    static constexpr int kFormatVersion = 1;
    static constexpr const char* kManifestEntry = "plugin.json";
    static constexpr const char* kFileExtension = ".jpkg";

    /**
     * @brief Unpacks a package and validates its manifest.
     * @param bytes Raw package contents.
     * @return The package, or PackageCorrupt, ManifestNotFound or ManifestInvalid.
     */
    static core::PluginResult<PluginPackage> parse(const Bytes& bytes);

    /**
     * @brief Builds a package from a manifest and implementation modules.
     * @param manifest The plugin manifest.
     * @param modules Module entries keyed by entry name.
     * @return The package. It is not validated; parse() its serialization to check it.
     */
    static PluginPackage create(const core::PluginManifest& manifest,
                                std::map<std::string, Bytes> modules = {});

    /**
     * @brief Encodes the package.
     * @return CBOR bytes of the package document.
     */
    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] const core::PluginManifest& manifest() const { return manifest_; }

    /**
     * @brief Looks up a module entry.
     * @param name Entry name.
     * @return Pointer to the entry bytes, or nullptr if absent.
     */
    [[nodiscard]] const Bytes* entry(const std::string& name) const;

    /**
     * @brief Lists module entry names (plugin.json excluded).
     * @return Entry names in sorted order.
     */
    [[nodiscard]] std::vector<std::string> moduleNames() const;

private:
    PluginPackage() = default;

    core::PluginManifest manifest_;
    std::map<std::string, Bytes> modules_;
};

} // namespace journal::infra

#include "infrastructure/plugin/PluginPackage.hpp"

#include <nlohmann/json.hpp>

namespace journal::infra {

using core::PluginErrorCode;
using core::PluginResult;

PluginResult<PluginPackage> PluginPackage::parse(const Bytes& bytes) {
    nlohmann::json document;
    try {
        document = nlohmann::json::from_cbor(bytes);
    } catch (const nlohmann::json::exception& e) {
        return PluginResult<PluginPackage>::err(PluginErrorCode::PackageCorrupt,
            std::string("Package is not a valid archive: ") + e.what());
    }

    if (!document.is_object() || document.value("format", "") != kFormat) {
        return PluginResult<PluginPackage>::err(PluginErrorCode::PackageCorrupt,
            "Package format marker missing");
    }

    int formatVersion = document.value("formatVersion", 0);
    if (formatVersion != kFormatVersion) {
        return PluginResult<PluginPackage>::err(PluginErrorCode::PackageCorrupt,
            "Unsupported package format version " + std::to_string(formatVersion));
    }

    if (!document.contains("entries") || !document["entries"].is_object()) {
        return PluginResult<PluginPackage>::err(PluginErrorCode::PackageCorrupt,
            "Package has no entry table");
    }

    PluginPackage package;
    const nlohmann::json* manifestEntry = nullptr;

    for (const auto& [name, value] : document["entries"].items()) {
        if (!value.is_binary()) {
            return PluginResult<PluginPackage>::err(PluginErrorCode::PackageCorrupt,
                "Package entry '" + name + "' is not a byte string");
        }
        if (name == kManifestEntry) {
            manifestEntry = &value;
            continue;
        }
        const auto& binary = value.get_binary();
        package.modules_[name] = Bytes(binary.begin(), binary.end());
    }

    if (!manifestEntry) {
        return PluginResult<PluginPackage>::err(PluginErrorCode::ManifestNotFound,
            "Plugin manifest not found in package");
    }

    const auto& manifestBytes = manifestEntry->get_binary();
    nlohmann::json manifestJson;
    try {
        manifestJson = nlohmann::json::parse(manifestBytes.begin(), manifestBytes.end());
    } catch (const nlohmann::json::exception& e) {
        return PluginResult<PluginPackage>::err(PluginErrorCode::ManifestInvalid,
            std::string("Manifest is not valid JSON: ") + e.what());
    }

    auto manifest = core::PluginManifest::fromJson(manifestJson);
    if (!manifest) {
        return PluginResult<PluginPackage>::err(manifest.error());
    }

    package.manifest_ = std::move(manifest).value();
    return PluginResult<PluginPackage>::ok(std::move(package));
}

PluginPackage PluginPackage::create(const core::PluginManifest& manifest,
                                    std::map<std::string, Bytes> modules) {
    PluginPackage package;
    package.manifest_ = manifest;
    package.modules_ = std::move(modules);
    return package;
}

Bytes PluginPackage::serialize() const {
    nlohmann::json document;
    document["format"] = kFormat;
    document["formatVersion"] = kFormatVersion;
    document["entries"] = nlohmann::json::object();

    auto manifestText = manifest_.toJson().dump(2);
    document["entries"][kManifestEntry] =
        nlohmann::json::binary(Bytes(manifestText.begin(), manifestText.end()));

    for (const auto& [name, bytes] : modules_) {
        document["entries"][name] = nlohmann::json::binary(bytes);
    }

    return nlohmann::json::to_cbor(document);
}

const Bytes* PluginPackage::entry(const std::string& name) const {
    auto it = modules_.find(name);
    return it != modules_.end() ? &it->second : nullptr;
}

std::vector<std::string> PluginPackage::moduleNames() const {
    std::vector<std::string> names;
    names.reserve(modules_.size());
    for (const auto& [name, _] : modules_) {
        names.push_back(name);
    }
    return names;
}

} // namespace journal::infra

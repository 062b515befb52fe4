/**
 * @file IPreferenceStore.hpp
 * @brief String-keyed preference storage provided by the host.
 */

#pragma once

#include <optional>
#include <string>

namespace journal::core {

/**
 * @brief Simple get/set contract over the host's persistence layer.
 *
 * The plugin host only defines the key namespaces it writes:
 * "plugin_enabled_<id>" for enable flags and "plugin_pref_<id>.<key>" for
 * plugin settings. Implementations must be safe under concurrent calls.
 */
class IPreferenceStore {
public:
    virtual ~IPreferenceStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;

    /// Removes every key starting with @p prefix.
    virtual bool removePrefix(const std::string& prefix) = 0;

    [[nodiscard]] std::string getString(const std::string& key, const std::string& defaultValue = "") const {
        return get(key).value_or(defaultValue);
    }

    [[nodiscard]] bool getBool(const std::string& key, bool defaultValue = false) const {
        auto value = get(key);
        if (!value) {
            return defaultValue;
        }
        return *value == "true";
    }

    bool setBool(const std::string& key, bool value) {
        return set(key, value ? "true" : "false");
    }
};

} // namespace journal::core

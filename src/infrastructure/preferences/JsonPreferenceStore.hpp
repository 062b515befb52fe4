#pragma once

#include "core/services/IPreferenceStore.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace journal::infra {

/**
 * @brief Preference store persisted as a flat JSON object.
 *
 * Every successful set() or remove() rewrites the file. Thread-safe.
 */
class JsonPreferenceStore : public core::IPreferenceStore {
public:
    /**
     * @brief Constructs a store backed by a file, loading it if it exists.
     * @param path Path to the JSON file. An empty path keeps values in memory only.
     */
    explicit JsonPreferenceStore(std::filesystem::path path = {});

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;

    /**
     * @brief Stores a value and persists the store.
     * @return False if the file could not be written. The value is kept in memory regardless.
     */
    bool set(const std::string& key, const std::string& value) override;

    /**
     * @brief Removes a value and persists the store.
     * @return False only if the file could not be written.
     */
    bool remove(const std::string& key) override;

    bool removePrefix(const std::string& prefix) override;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    bool loadLocked();
    bool saveLocked() const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

} // namespace journal::infra

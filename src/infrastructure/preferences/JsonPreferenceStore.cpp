#include "infrastructure/preferences/JsonPreferenceStore.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace journal::infra {

JsonPreferenceStore::JsonPreferenceStore(std::filesystem::path path) : path_(std::move(path)) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!path_.empty() && std::filesystem::exists(path_) && !loadLocked()) {
        spdlog::warn("Starting with empty preferences");
    }
}

std::optional<std::string> JsonPreferenceStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonPreferenceStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return saveLocked();
}

bool JsonPreferenceStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (values_.erase(key) == 0) {
        return true;
    }
    return saveLocked();
}

bool JsonPreferenceStore::removePrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = values_.lower_bound(prefix); it != values_.end() && it->first.rfind(prefix, 0) == 0;) {
        it = values_.erase(it);
        ++removed;
    }
    if (removed == 0) {
        return true;
    }
    spdlog::debug("Removed {} preferences under '{}'", removed, prefix);
    return saveLocked();
}

std::size_t JsonPreferenceStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

bool JsonPreferenceStore::loadLocked() {
    try {
        std::ifstream file(path_);
        if (!file) {
            spdlog::error("Failed to open preferences file: {}", path_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            spdlog::warn("Preferences file is not an object, ignoring: {}", path_.string());
            return false;
        }

        for (const auto& [key, value] : j.items()) {
            if (value.is_string()) {
                values_[key] = value.get<std::string>();
            } else {
                values_[key] = value.dump();
            }
        }

        spdlog::debug("Loaded {} preferences from {}", values_.size(), path_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load preferences: {}", e.what());
        return false;
    }
}

bool JsonPreferenceStore::saveLocked() const {
    if (path_.empty()) {
        return true;
    }

    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        std::ofstream file(path_);
        if (!file) {
            spdlog::error("Failed to open preferences file for writing: {}", path_.string());
            return false;
        }

        nlohmann::json j(values_);
        file << j.dump(2);
        return static_cast<bool>(file);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save preferences: {}", e.what());
        return false;
    }
}

} // namespace journal::infra

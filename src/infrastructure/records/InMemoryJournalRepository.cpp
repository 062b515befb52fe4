#include "infrastructure/records/InMemoryJournalRepository.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace journal::infra {

InMemoryJournalRepository::InMemoryJournalRepository(std::vector<core::Experience> experiences,
                                                     std::vector<core::Substance> substances)
    : experiences_(std::move(experiences))
    , substances_(std::move(substances)) {
    for (const auto& experience : experiences_) {
        nextId_ = std::max(nextId_, experience.id + 1);
    }
}

bool InMemoryJournalRepository::loadFromFile(const std::filesystem::path& path) {
    std::vector<core::Experience> experiences;
    std::vector<core::Substance> substances;

    try {
        std::ifstream file(path);
        if (!file) {
            spdlog::error("Failed to open records file: {}", path.string());
            return false;
        }

        nlohmann::json j;
        file >> j;

        if (j.contains("experiences") && j["experiences"].is_array()) {
            for (const auto& item : j["experiences"]) {
                experiences.push_back(core::Experience::fromJson(item));
            }
        }
        if (j.contains("substances") && j["substances"].is_array()) {
            for (const auto& item : j["substances"]) {
                substances.push_back(core::Substance::fromJson(item));
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to load records from {}: {}", path.string(), e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    experiences_ = std::move(experiences);
    substances_ = std::move(substances);
    nextId_ = 1;
    for (const auto& experience : experiences_) {
        nextId_ = std::max(nextId_, experience.id + 1);
    }

    spdlog::info("Loaded {} experiences and {} substances from {}",
        experiences_.size(), substances_.size(), path.string());
    return true;
}

std::vector<core::Experience> InMemoryJournalRepository::getExperiences() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return experiences_;
}

std::vector<core::Substance> InMemoryJournalRepository::getSubstances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return substances_;
}

int64_t InMemoryJournalRepository::addExperience(const core::Experience& experience) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = experience;
    if (stored.id == 0) {
        stored.id = nextId_;
    }
    nextId_ = std::max(nextId_, stored.id + 1);
    experiences_.push_back(std::move(stored));
    return experiences_.back().id;
}

void InMemoryJournalRepository::addSubstance(const core::Substance& substance) {
    std::lock_guard<std::mutex> lock(mutex_);
    substances_.push_back(substance);
}

} // namespace journal::infra

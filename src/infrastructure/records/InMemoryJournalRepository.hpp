#pragma once

#include "core/services/IJournalRepository.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

namespace journal::infra {

/**
 * @brief Record store held in memory, optionally seeded from a JSON file.
 *
 * The file layout is {"experiences": [...], "substances": [...]} with times
 * in epoch milliseconds. Thread-safe.
 */
class InMemoryJournalRepository : public core::IJournalRepository {
public:
    InMemoryJournalRepository() = default;
    InMemoryJournalRepository(std::vector<core::Experience> experiences,
                              std::vector<core::Substance> substances);

    /**
     * @brief Replaces the contents with the records in a JSON file.
     * @param path Path to the records file.
     * @return True if the file was read and parsed, false otherwise.
     */
    bool loadFromFile(const std::filesystem::path& path);

    [[nodiscard]] std::vector<core::Experience> getExperiences() const override;
    [[nodiscard]] std::vector<core::Substance> getSubstances() const override;
    int64_t addExperience(const core::Experience& experience) override;

    void addSubstance(const core::Substance& substance);

private:
    mutable std::mutex mutex_;
    std::vector<core::Experience> experiences_;
    std::vector<core::Substance> substances_;
    int64_t nextId_{1};
};

} // namespace journal::infra

/**
 * @file IJournalRepository.hpp
 * @brief Interface to the host's experience and substance records.
 *
 * The record store itself belongs to the host. Plugins never see this
 * interface directly; they reach it through their permission-checked
 * IPluginContext.
 */

#pragma once

#include "core/types/Experience.hpp"

#include <vector>

namespace journal::core {

/**
 * @brief Interface for the journal record store.
 *
 * Implementations must be safe under concurrent calls from several plugins.
 */
class IJournalRepository {
public:
    virtual ~IJournalRepository() = default;

    /**
     * @brief Retrieves all experiences, oldest first.
     * @return Vector of experiences.
     */
    [[nodiscard]] virtual std::vector<Experience> getExperiences() const = 0;

    /**
     * @brief Retrieves the substance catalogue.
     * @return Vector of known substances.
     */
    [[nodiscard]] virtual std::vector<Substance> getSubstances() const = 0;

    /**
     * @brief Stores a new experience.
     * @param experience The experience to add. An id of 0 is replaced by a generated id.
     * @return The id of the stored experience.
     */
    virtual int64_t addExperience(const Experience& experience) = 0;
};

} // namespace journal::core

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace journal::core {

using TimePoint = std::chrono::system_clock::time_point;

enum class AdministrationRoute : int {
    Oral = 0,
    Sublingual = 1,
    Buccal = 2,
    Insufflated = 3,
    Rectal = 4,
    Transdermal = 5,
    Subcutaneous = 6,
    Intramuscular = 7,
    Intravenous = 8,
    Smoked = 9,
    Inhaled = 10
};

std::string routeToString(AdministrationRoute route);
AdministrationRoute routeFromString(const std::string& str);

struct Ingestion {
    int64_t id{0};
    std::string substanceName;
    TimePoint time;
    std::optional<TimePoint> endTime;
    AdministrationRoute route{AdministrationRoute::Oral};
    std::optional<double> dose;
    bool isDoseAnEstimate{false};
    std::string units;
    std::optional<std::string> notes;

    [[nodiscard]] nlohmann::json toJson() const;
    static Ingestion fromJson(const nlohmann::json& j);

    bool operator==(const Ingestion& other) const = default;
};

/**
 * @brief One journal entry: a session with zero or more ingestions.
 *
 * overallRating is on a 1..5 scale when present.
 */
struct Experience {
    int64_t id{0};
    std::string title;
    std::string text;
    std::optional<TimePoint> date;
    std::optional<std::string> location;
    std::optional<int> overallRating;
    std::vector<Ingestion> ingestions;

    /**
     * @brief Finds the first ingestion of a substance in this experience.
     * @param substanceName Exact substance name.
     * @return Pointer to the ingestion, or nullptr if the substance was not taken.
     */
    [[nodiscard]] const Ingestion* findIngestion(const std::string& substanceName) const;

    /**
     * @brief Date used for ordering: the experience date, else the earliest ingestion time.
     * @return Effective date, or nullopt if the experience carries no time at all.
     */
    [[nodiscard]] std::optional<TimePoint> effectiveDate() const;

    [[nodiscard]] nlohmann::json toJson() const;
    static Experience fromJson(const nlohmann::json& j);

    bool operator==(const Experience& other) const = default;
};

struct Substance {
    std::string name;
    std::vector<std::string> commonNames;
    std::vector<std::string> categories;
    std::vector<std::string> interactions;

    [[nodiscard]] nlohmann::json toJson() const;
    static Substance fromJson(const nlohmann::json& j);

    bool operator==(const Substance& other) const = default;
};

/**
 * @brief Converts a time point to milliseconds since the Unix epoch.
 */
int64_t toEpochMillis(TimePoint time);

/**
 * @brief Converts milliseconds since the Unix epoch to a time point.
 */
TimePoint fromEpochMillis(int64_t millis);

} // namespace journal::core

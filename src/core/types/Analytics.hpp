/**
 * @file Analytics.hpp
 * @brief Input and output types exchanged with analytics, visualization and
 *        conversational capabilities.
 */

#pragma once

#include "core/types/Experience.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace journal::core {

/**
 * @brief Inclusive time window.
 */
struct TimeRange {
    TimePoint start;
    TimePoint end;

    [[nodiscard]] bool contains(TimePoint time) const {
        return time >= start && time <= end;
    }
};

/**
 * @brief Everything one analysis pass receives.
 *
 * Constructed per invocation by the caller. Dispatch hands each analyzer its
 * own copy, so analyzers never share mutable state.
 */
struct AnalyticsContext {
    std::vector<Experience> experiences;             ///< Historical records, in caller order
    std::vector<Substance> substances;               ///< Optional substance catalogue
    std::optional<TimeRange> timeRange;              ///< Optional bounding window
    std::map<std::string, std::string> filters;      ///< Optional caller-defined filters
};

enum class InsightSeverity : int { Low = 0, Medium = 1, High = 2, Critical = 3 };

enum class RecommendationPriority : int { Low = 0, Medium = 1, High = 2, Urgent = 3 };

enum class RecommendationCategory : int {
    Safety = 0,
    Optimization = 1,
    Health = 2,
    Integration = 3,
    Timing = 4
};

enum class VisualizationType : int {
    LineChart = 0,
    BarChart = 1,
    ScatterPlot = 2,
    HeatMap = 3,
    NetworkGraph = 4,
    Timeline = 5,
    Calendar = 6,
    Gauge = 7
};

std::string insightSeverityToString(InsightSeverity severity);
std::string recommendationPriorityToString(RecommendationPriority priority);
std::string recommendationCategoryToString(RecommendationCategory category);
std::string visualizationTypeToString(VisualizationType type);

/**
 * @brief A generated observation about the user's data.
 */
struct Insight {
    std::string id;
    std::string title;
    std::string description;
    double confidence{0.0};                        ///< In [0, 1]
    InsightSeverity severity{InsightSeverity::Low};
    nlohmann::json metadata = nlohmann::json::object();

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief An actionable suggestion derived from one or more insights.
 */
struct Recommendation {
    std::string id;
    std::string title;
    std::string description;
    bool actionable{true};
    RecommendationPriority priority{RecommendationPriority::Medium};
    RecommendationCategory category{RecommendationCategory::Safety};

    [[nodiscard]] nlohmann::json toJson() const;
};

struct RiskFactor {
    std::string factor;
    double severity{0.0};
    std::string description;
};

/**
 * @brief Aggregate risk score with its contributing factors.
 */
struct RiskAssessment {
    double overallRisk{0.0};                     ///< Clamped to [0, 1]
    std::vector<RiskFactor> riskFactors;
    std::vector<std::string> mitigationStrategies;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Typed chart payload with a generic data map.
 */
struct VisualizationData {
    VisualizationType type{VisualizationType::BarChart};
    nlohmann::json data = nlohmann::json::object();
    std::string title;
    std::optional<std::string> description;

    [[nodiscard]] nlohmann::json toJson() const;
};

/**
 * @brief Output of one analytics capability invocation.
 */
struct AnalyticsResult {
    std::vector<Insight> insights;
    std::vector<Recommendation> recommendations;
    std::optional<RiskAssessment> riskAssessment;
    std::vector<VisualizationData> visualizations;

    /**
     * @brief Appends another result. Keeps the first risk assessment seen.
     * @param other The result to merge into this one.
     */
    void merge(AnalyticsResult other);

    [[nodiscard]] nlohmann::json toJson() const;
};

struct VisualizationContext {
    VisualizationData data;
    bool interactive{true};
    bool exportable{true};
};

/**
 * @brief Output of a visualization capability: a rendered document and its MIME type.
 */
struct RenderedVisualization {
    std::string mimeType;
    std::string content;
};

struct ConversationalQuery {
    std::string query;
    std::map<std::string, std::string> context;
    std::vector<Experience> userHistory;
};

struct ConversationalResponse {
    std::string response;
    double confidence{0.0};
    std::vector<std::string> suggestions;
    std::vector<std::string> followUpQuestions;
};

} // namespace journal::core

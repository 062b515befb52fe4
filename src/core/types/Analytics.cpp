#include "core/types/Analytics.hpp"

#include <iterator>

namespace journal::core {

std::string insightSeverityToString(InsightSeverity severity) {
    switch (severity) {
    case InsightSeverity::Low:
        return "LOW";
    case InsightSeverity::Medium:
        return "MEDIUM";
    case InsightSeverity::High:
        return "HIGH";
    case InsightSeverity::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string recommendationPriorityToString(RecommendationPriority priority) {
    switch (priority) {
    case RecommendationPriority::Low:
        return "LOW";
    case RecommendationPriority::Medium:
        return "MEDIUM";
    case RecommendationPriority::High:
        return "HIGH";
    case RecommendationPriority::Urgent:
        return "URGENT";
    }
    return "UNKNOWN";
}

std::string recommendationCategoryToString(RecommendationCategory category) {
    switch (category) {
    case RecommendationCategory::Safety:
        return "SAFETY";
    case RecommendationCategory::Optimization:
        return "OPTIMIZATION";
    case RecommendationCategory::Health:
        return "HEALTH";
    case RecommendationCategory::Integration:
        return "INTEGRATION";
    case RecommendationCategory::Timing:
        return "TIMING";
    }
    return "UNKNOWN";
}

std::string visualizationTypeToString(VisualizationType type) {
    switch (type) {
    case VisualizationType::LineChart:
        return "LINE_CHART";
    case VisualizationType::BarChart:
        return "BAR_CHART";
    case VisualizationType::ScatterPlot:
        return "SCATTER_PLOT";
    case VisualizationType::HeatMap:
        return "HEAT_MAP";
    case VisualizationType::NetworkGraph:
        return "NETWORK_GRAPH";
    case VisualizationType::Timeline:
        return "TIMELINE";
    case VisualizationType::Calendar:
        return "CALENDAR";
    case VisualizationType::Gauge:
        return "GAUGE";
    }
    return "UNKNOWN";
}

nlohmann::json Insight::toJson() const {
    return {
        {"id", id},
        {"title", title},
        {"description", description},
        {"confidence", confidence},
        {"severity", insightSeverityToString(severity)},
        {"metadata", metadata}
    };
}

nlohmann::json Recommendation::toJson() const {
    return {
        {"id", id},
        {"title", title},
        {"description", description},
        {"actionable", actionable},
        {"priority", recommendationPriorityToString(priority)},
        {"category", recommendationCategoryToString(category)}
    };
}

nlohmann::json RiskAssessment::toJson() const {
    nlohmann::json j;
    j["overallRisk"] = overallRisk;
    j["riskFactors"] = nlohmann::json::array();
    for (const auto& factor : riskFactors) {
        j["riskFactors"].push_back({
            {"factor", factor.factor},
            {"severity", factor.severity},
            {"description", factor.description}
        });
    }
    j["mitigationStrategies"] = mitigationStrategies;
    return j;
}

nlohmann::json VisualizationData::toJson() const {
    nlohmann::json j;
    j["type"] = visualizationTypeToString(type);
    j["title"] = title;
    j["description"] = description ? nlohmann::json(*description) : nlohmann::json(nullptr);
    j["data"] = data;
    return j;
}

void AnalyticsResult::merge(AnalyticsResult other) {
    insights.insert(insights.end(),
        std::make_move_iterator(other.insights.begin()),
        std::make_move_iterator(other.insights.end()));
    recommendations.insert(recommendations.end(),
        std::make_move_iterator(other.recommendations.begin()),
        std::make_move_iterator(other.recommendations.end()));
    visualizations.insert(visualizations.end(),
        std::make_move_iterator(other.visualizations.begin()),
        std::make_move_iterator(other.visualizations.end()));
    if (!riskAssessment && other.riskAssessment) {
        riskAssessment = std::move(other.riskAssessment);
    }
}

nlohmann::json AnalyticsResult::toJson() const {
    nlohmann::json j;
    j["insights"] = nlohmann::json::array();
    for (const auto& insight : insights) {
        j["insights"].push_back(insight.toJson());
    }
    j["recommendations"] = nlohmann::json::array();
    for (const auto& recommendation : recommendations) {
        j["recommendations"].push_back(recommendation.toJson());
    }
    j["riskAssessment"] = riskAssessment ? riskAssessment->toJson() : nlohmann::json(nullptr);
    j["visualizations"] = nlohmann::json::array();
    for (const auto& visualization : visualizations) {
        j["visualizations"].push_back(visualization.toJson());
    }
    return j;
}

} // namespace journal::core

#include "PatternAnalyzer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace journal::plugins {

using core::AnalyticsContext;
using core::AnalyticsResult;
using core::Experience;
using core::Insight;
using core::InsightSeverity;
using core::Recommendation;
using core::RecommendationCategory;
using core::RecommendationPriority;
using core::TimePoint;
using core::VisualizationData;
using core::VisualizationType;

namespace {

constexpr double kNegativeShareThreshold = 0.6;
constexpr double kCriticalNegativeShare = 0.8;
constexpr double kDoseIncreaseFactor = 1.2;
constexpr double kInverseCorrelationThreshold = -0.3;
constexpr std::size_t kMinRatedExperiences = 5;
constexpr std::size_t kRecentWindow = 5;
constexpr auto kFrequencyWindow = std::chrono::hours(24 * 30);

using Days = std::chrono::duration<double, std::ratio<86400>>;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool containsIgnoreCase(const std::string& text, const std::string& needle) {
    return toLower(text).find(toLower(needle)) != std::string::npos;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

template <typename Container>
std::string join(const Container& items, const std::string& separator) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += item;
    }
    return joined;
}

bool isNegative(const Experience& experience) {
    return experience.overallRating && *experience.overallRating <= 2;
}

/// Experiences inside the context's time range. Undated ones are kept only without a range.
std::vector<const Experience*> experiencesInRange(const AnalyticsContext& context) {
    std::vector<const Experience*> selected;
    selected.reserve(context.experiences.size());
    for (const auto& experience : context.experiences) {
        if (context.timeRange) {
            auto date = experience.effectiveDate();
            if (!date || !context.timeRange->contains(*date)) {
                continue;
            }
        }
        selected.push_back(&experience);
    }
    return selected;
}

std::set<std::string> substancesOf(const Experience& experience) {
    std::set<std::string> names;
    for (const auto& ingestion : experience.ingestions) {
        names.insert(ingestion.substanceName);
    }
    return names;
}

/// Earliest ingestion time of a substance within one experience.
std::optional<TimePoint> firstIngestionOf(const Experience& experience, const std::string& substance) {
    std::optional<TimePoint> first;
    for (const auto& ingestion : experience.ingestions) {
        if (ingestion.substanceName == substance && (!first || ingestion.time < *first)) {
            first = ingestion.time;
        }
    }
    return first;
}

InsightSeverity severityForLevel(double risk) {
    if (risk >= 0.7) return InsightSeverity::High;
    if (risk >= 0.4) return InsightSeverity::Medium;
    return InsightSeverity::Low;
}

RecommendationPriority priorityForLevel(double risk) {
    if (risk >= 0.7) return RecommendationPriority::High;
    if (risk >= 0.4) return RecommendationPriority::Medium;
    return RecommendationPriority::Low;
}

std::string levelName(double risk) {
    if (risk >= 0.7) return "HIGH";
    if (risk >= 0.4) return "MEDIUM";
    return "LOW";
}

} // namespace

const std::vector<std::pair<std::string, std::string>>& PatternAnalyzer::knownDangerousPairs() {
    static const std::vector<std::pair<std::string, std::string>> pairs = {
        {"MDMA", "MAOI"},
        {"Cocaine", "Alcohol"},
        {"Tramadol", "MDMA"},
        {"Lithium", "LSD"},
        {"Lithium", "Psilocybin"}
    };
    return pairs;
}

std::set<PatternAnalysis> PatternAnalyzer::allAnalyses() {
    return {PatternAnalysis::Interactions, PatternAnalysis::Tolerance, PatternAnalysis::Quality,
            PatternAnalysis::Timing, PatternAnalysis::Risk};
}

AnalyticsResult PatternAnalyzer::analyze(const AnalyticsContext& context,
                                         const std::set<PatternAnalysis>& selection,
                                         std::stop_token stopToken) {
    AnalyticsResult combined;
    for (auto analysis : selection) {
        if (stopToken.stop_requested()) {
            break;
        }
        switch (analysis) {
            case PatternAnalysis::Interactions:
                combined.merge(analyzeInteractions(context, stopToken));
                break;
            case PatternAnalysis::Tolerance:
                combined.merge(analyzeTolerance(context, stopToken));
                break;
            case PatternAnalysis::Quality:
                combined.merge(analyzeQuality(context, stopToken));
                break;
            case PatternAnalysis::Timing:
                combined.merge(analyzeTiming(context, stopToken));
                break;
            case PatternAnalysis::Risk:
                combined.merge(assessRisk(context, stopToken));
                break;
        }
    }
    return combined;
}

AnalyticsResult PatternAnalyzer::analyzeInteractions(const AnalyticsContext& context,
                                                     std::stop_token stopToken) {
    AnalyticsResult result;

    std::map<std::set<std::string>, std::vector<const Experience*>> combinations;
    for (const auto* experience : experiencesInRange(context)) {
        auto substances = substancesOf(*experience);
        if (substances.size() >= 2) {
            combinations[substances].push_back(experience);
        }
    }

    nlohmann::json graph = nlohmann::json::array();

    for (const auto& [substances, experiences] : combinations) {
        if (stopToken.stop_requested()) {
            break;
        }

        auto label = join(substances, " + ");
        auto key = join(substances, "-");

        std::vector<double> ratings;
        std::size_t negative = 0;
        for (const auto* experience : experiences) {
            if (experience->overallRating) {
                ratings.push_back(*experience->overallRating);
            }
            if (isNegative(*experience)) {
                ++negative;
            }
        }
        double averageRating = 0.0;
        if (!ratings.empty()) {
            for (double rating : ratings) averageRating += rating;
            averageRating /= static_cast<double>(ratings.size());
        }
        graph.push_back({
            {"substances", std::vector<std::string>(substances.begin(), substances.end())},
            {"experiences", experiences.size()},
            {"averageRating", averageRating}
        });

        if (experiences.size() >= 2) {
            double share = static_cast<double>(negative) / static_cast<double>(experiences.size());
            if (share > kNegativeShareThreshold) {
                Insight insight;
                insight.id = "dangerous-combination-" + key;
                insight.title = "Potentially Dangerous Combination Detected";
                insight.description = fmt::format(
                    "The combination of {} has resulted in negative experiences {}/{} times",
                    label, negative, experiences.size());
                insight.confidence = std::min(0.9, share);
                insight.severity = share > kCriticalNegativeShare ? InsightSeverity::Critical
                                                                  : InsightSeverity::High;
                insight.metadata = {{"substances", label}, {"negativeShare", share}};
                result.insights.push_back(std::move(insight));

                Recommendation recommendation;
                recommendation.id = "avoid-combination-" + key;
                recommendation.title = "Avoid This Combination";
                recommendation.description = fmt::format(
                    "Consider avoiding the combination of {} based on your experience history", label);
                recommendation.priority = RecommendationPriority::High;
                recommendation.category = RecommendationCategory::Safety;
                result.recommendations.push_back(std::move(recommendation));
            }
        }

        // Both members of a pair must match, each by a different substance.
        std::vector<std::string> matchedPairs;
        for (const auto& [first, second] : knownDangerousPairs()) {
            bool matched = false;
            for (const auto& a : substances) {
                if (!containsIgnoreCase(a, first)) continue;
                for (const auto& b : substances) {
                    if (b != a && containsIgnoreCase(b, second)) {
                        matched = true;
                        break;
                    }
                }
                if (matched) break;
            }
            if (matched) {
                matchedPairs.push_back(first + " + " + second);
            }
        }

        if (!matchedPairs.empty()) {
            Insight insight;
            insight.id = "known-dangerous-" + key;
            insight.title = "Known Dangerous Interaction";
            insight.description = fmt::format(
                "{} contains substances known to interact dangerously ({})",
                label, join(matchedPairs, ", "));
            insight.confidence = 0.95;
            insight.severity = InsightSeverity::Critical;
            insight.metadata = {{"substances", label}, {"pairs", matchedPairs}};
            result.insights.push_back(std::move(insight));
        }
    }

    VisualizationData visualization;
    visualization.type = VisualizationType::NetworkGraph;
    visualization.title = "Substance Interaction Network";
    visualization.description = "Substance combinations and their average ratings";
    visualization.data = {{"combinations", graph}};
    result.visualizations.push_back(std::move(visualization));

    return result;
}

AnalyticsResult PatternAnalyzer::analyzeTolerance(const AnalyticsContext& context,
                                                  std::stop_token stopToken) {
    AnalyticsResult result;

    struct Observation {
        TimePoint time;
        double dose;
        std::optional<int> rating;
    };

    std::map<std::string, std::vector<Observation>> bySubstance;
    for (const auto* experience : experiencesInRange(context)) {
        for (const auto& ingestion : experience->ingestions) {
            if (!ingestion.dose) {
                continue;
            }
            bySubstance[ingestion.substanceName].push_back(
                {ingestion.time, *ingestion.dose, experience->overallRating});
        }
    }

    nlohmann::json trends = nlohmann::json::object();

    for (auto& [substance, observations] : bySubstance) {
        if (stopToken.stop_requested()) {
            break;
        }

        std::stable_sort(observations.begin(), observations.end(),
            [](const Observation& a, const Observation& b) { return a.time < b.time; });

        auto& series = trends[substance] = nlohmann::json::array();
        for (const auto& observation : observations) {
            series.push_back({
                {"time", core::toEpochMillis(observation.time)},
                {"dose", observation.dose},
                {"rating", observation.rating ? nlohmann::json(*observation.rating) : nlohmann::json(nullptr)}
            });
        }

        if (observations.size() >= 3) {
            std::size_t increases = 0;
            for (std::size_t i = 1; i < observations.size(); ++i) {
                if (observations[i].dose > observations[i - 1].dose * kDoseIncreaseFactor) {
                    ++increases;
                }
            }
            double ratio = static_cast<double>(increases) / static_cast<double>(observations.size() - 1);

            if (ratio > 0.5) {
                Insight insight;
                insight.id = "tolerance-buildup-" + substance;
                insight.title = "Tolerance Buildup Detected";
                insight.description = fmt::format(
                    "Your doses of {} have been increasing over time, indicating tolerance buildup", substance);
                insight.confidence = ratio;
                insight.severity = ratio > 0.8 ? InsightSeverity::High
                                 : ratio > 0.6 ? InsightSeverity::Medium
                                               : InsightSeverity::Low;
                insight.metadata = {{"substance", substance}, {"increaseRatio", ratio}};
                result.insights.push_back(std::move(insight));

                Recommendation recommendation;
                recommendation.id = "tolerance-break-" + substance;
                recommendation.title = "Consider a Tolerance Break";
                recommendation.description = fmt::format(
                    "A tolerance break for {} could help reset your sensitivity and reduce required doses",
                    substance);
                recommendation.priority = RecommendationPriority::Medium;
                recommendation.category = RecommendationCategory::Optimization;
                result.recommendations.push_back(std::move(recommendation));
            }
        }

        std::vector<double> doses;
        std::vector<double> ratings;
        for (const auto& observation : observations) {
            if (observation.rating) {
                doses.push_back(observation.dose);
                ratings.push_back(*observation.rating);
            }
        }

        if (doses.size() >= 3) {
            double correlation = pearsonCorrelation(doses, ratings);
            if (correlation < kInverseCorrelationThreshold) {
                Insight insight;
                insight.id = "dosage-quality-inverse-" + substance;
                insight.title = "Higher Doses Linked to Worse Experiences";
                insight.description = fmt::format(
                    "Your experience quality with {} tends to decrease at higher doses", substance);
                insight.confidence = std::abs(correlation);
                insight.severity = InsightSeverity::Medium;
                insight.metadata = {{"substance", substance}, {"correlation", correlation}};
                result.insights.push_back(std::move(insight));

                Recommendation recommendation;
                recommendation.id = "reduce-dosage-" + substance;
                recommendation.title = "Consider Lower Doses";
                recommendation.description = fmt::format(
                    "Your data suggests better experiences with lower doses of {}", substance);
                recommendation.priority = RecommendationPriority::Medium;
                recommendation.category = RecommendationCategory::Optimization;
                result.recommendations.push_back(std::move(recommendation));
            }
        }
    }

    VisualizationData visualization;
    visualization.type = VisualizationType::LineChart;
    visualization.title = "Tolerance Patterns Over Time";
    visualization.description = "Dose and experience rating per substance";
    visualization.data = {{"substanceTrends", trends}};
    result.visualizations.push_back(std::move(visualization));

    return result;
}

AnalyticsResult PatternAnalyzer::analyzeQuality(const AnalyticsContext& context,
                                                std::stop_token stopToken) {
    AnalyticsResult result;

    std::vector<const Experience*> rated;
    for (const auto* experience : experiencesInRange(context)) {
        if (experience->overallRating) {
            rated.push_back(experience);
        }
    }

    if (rated.size() < kMinRatedExperiences) {
        Insight insight;
        insight.id = "insufficient-data";
        insight.title = "Insufficient Data for Quality Analysis";
        insight.description = fmt::format(
            "At least {} rated experiences are needed for quality correlation analysis, found {}",
            kMinRatedExperiences, rated.size());
        insight.confidence = 1.0;
        insight.severity = InsightSeverity::Low;
        result.insights.push_back(std::move(insight));
        return result;
    }

    std::size_t positive = 0;
    std::size_t negative = 0;
    std::map<std::string, std::pair<double, int>> byLocation;
    for (const auto* experience : rated) {
        int rating = *experience->overallRating;
        if (rating >= 4) ++positive;
        if (rating <= 2) ++negative;
        if (experience->location && !isBlank(*experience->location)) {
            auto& [sum, count] = byLocation[*experience->location];
            sum += rating;
            ++count;
        }
    }

    nlohmann::json locationRatings = nlohmann::json::object();
    for (const auto& [location, totals] : byLocation) {
        if (stopToken.stop_requested()) {
            break;
        }

        double average = totals.first / totals.second;
        locationRatings[location] = average;

        if (byLocation.size() < 2) {
            continue;
        }

        if (average >= 4.0) {
            Recommendation recommendation;
            recommendation.id = "optimal-location-" + location;
            recommendation.title = "Optimal Location Identified";
            recommendation.description = fmt::format(
                "{} appears to be an optimal setting for your experiences (avg rating: {:.1f})",
                location, average);
            recommendation.priority = RecommendationPriority::Medium;
            recommendation.category = RecommendationCategory::Optimization;
            result.recommendations.push_back(std::move(recommendation));
        } else if (average <= 2.5) {
            Insight insight;
            insight.id = "suboptimal-location-" + location;
            insight.title = "Suboptimal Setting Detected";
            insight.description = fmt::format(
                "{} may not be ideal for your experiences (avg rating: {:.1f})", location, average);
            insight.confidence = 0.7;
            insight.severity = InsightSeverity::Medium;
            insight.metadata = {{"location", location}, {"averageRating", average}};
            result.insights.push_back(std::move(insight));
        }
    }

    VisualizationData visualization;
    visualization.type = VisualizationType::BarChart;
    visualization.title = "Experience Quality Factors";
    visualization.description = "Average rating per location with positive and negative counts";
    visualization.data = {
        {"locationRatings", locationRatings},
        {"positiveExperiences", positive},
        {"negativeExperiences", negative}
    };
    result.visualizations.push_back(std::move(visualization));

    return result;
}

AnalyticsResult PatternAnalyzer::analyzeTiming(const AnalyticsContext& context,
                                               std::stop_token stopToken) {
    AnalyticsResult result;

    std::map<std::string, std::vector<TimePoint>> uses;
    for (const auto* experience : experiencesInRange(context)) {
        for (const auto& substance : substancesOf(*experience)) {
            auto when = experience->date ? experience->date : firstIngestionOf(*experience, substance);
            if (when) {
                uses[substance].push_back(*when);
            }
        }
    }

    nlohmann::json timelines = nlohmann::json::object();
    nlohmann::json minimums = nlohmann::json::object();

    for (auto& [substance, dates] : uses) {
        if (stopToken.stop_requested()) {
            break;
        }
        if (dates.size() < 3) {
            continue;
        }

        std::sort(dates.begin(), dates.end());
        std::vector<double> intervals;
        for (std::size_t i = 1; i < dates.size(); ++i) {
            intervals.push_back(std::chrono::duration_cast<Days>(dates[i] - dates[i - 1]).count());
        }
        double average = 0.0;
        for (double interval : intervals) average += interval;
        average /= static_cast<double>(intervals.size());

        int minimum = minimumSafeIntervalDays(substance);
        timelines[substance] = {{"intervalsDays", intervals}, {"averageIntervalDays", average}};
        minimums[substance] = minimum;

        if (average >= minimum) {
            continue;
        }

        double ratio = average / minimum;
        Insight insight;
        insight.id = "frequent-use-" + substance;
        insight.title = "Frequent Use Pattern Detected";
        insight.description = fmt::format(
            "Your {} use (every {:.1f} days on average) is more frequent than the recommended {} days",
            substance, average, minimum);
        insight.confidence = 0.8;
        insight.severity = ratio < 0.5 ? InsightSeverity::High
                         : ratio < 0.7 ? InsightSeverity::Medium
                                       : InsightSeverity::Low;
        insight.metadata = {
            {"substance", substance},
            {"averageIntervalDays", average},
            {"minimumIntervalDays", minimum}
        };
        result.insights.push_back(std::move(insight));

        Recommendation recommendation;
        recommendation.id = "spacing-recommendation-" + substance;
        recommendation.title = "Increase Time Between Uses";
        recommendation.description = fmt::format(
            "Consider spacing {} experiences at least {} days apart for optimal effects and safety",
            substance, minimum);
        recommendation.priority = RecommendationPriority::High;
        recommendation.category = RecommendationCategory::Safety;
        result.recommendations.push_back(std::move(recommendation));
    }

    VisualizationData visualization;
    visualization.type = VisualizationType::Timeline;
    visualization.title = "Usage Timing Patterns";
    visualization.description = "Intervals between uses and recommended minimums";
    visualization.data = {{"substanceTimelines", timelines}, {"recommendedIntervals", minimums}};
    result.visualizations.push_back(std::move(visualization));

    return result;
}

AnalyticsResult PatternAnalyzer::assessRisk(const AnalyticsContext& context, std::stop_token stopToken) {
    AnalyticsResult result;

    struct Dated {
        const Experience* experience;
        std::optional<TimePoint> date;
    };

    std::vector<Dated> recent;
    for (const auto* experience : experiencesInRange(context)) {
        recent.push_back({experience, experience->effectiveDate()});
    }
    // Most recent first; undated records sort last.
    std::stable_sort(recent.begin(), recent.end(), [](const Dated& a, const Dated& b) {
        if (a.date && b.date) return *a.date > *b.date;
        return a.date.has_value() && !b.date.has_value();
    });

    std::optional<TimePoint> reference;
    if (context.timeRange) {
        reference = context.timeRange->end;
    } else if (!recent.empty() && recent.front().date) {
        reference = recent.front().date;
    }

    core::RiskAssessment assessment;
    double overall = 0.0;

    std::size_t frequency = 0;
    if (reference) {
        auto windowStart = *reference - kFrequencyWindow;
        for (const auto& item : recent) {
            if (item.date && *item.date > windowStart && *item.date <= *reference) {
                ++frequency;
            }
        }
    }
    if (frequency > 3) {
        double severity = std::min(1.0, static_cast<double>(frequency) / 10.0);
        assessment.riskFactors.push_back({"High Recent Activity", severity,
            fmt::format("{} experiences in the last 30 days", frequency)});
        assessment.mitigationStrategies.push_back("Take a break from psychoactive substances");
        overall += severity * 0.3;
    }

    if (!stopToken.stop_requested()) {
        std::set<std::string> substances;
        std::size_t negative = 0;
        for (std::size_t i = 0; i < recent.size() && i < kRecentWindow; ++i) {
            auto names = substancesOf(*recent[i].experience);
            substances.insert(names.begin(), names.end());
            if (isNegative(*recent[i].experience)) {
                ++negative;
            }
        }

        if (substances.size() > 3) {
            double severity = std::min(1.0, static_cast<double>(substances.size()) / 8.0);
            assessment.riskFactors.push_back({"Multiple Substances", severity,
                fmt::format("{} different substances used recently", substances.size())});
            assessment.mitigationStrategies.push_back(
                "Focus on one substance type to reduce interaction risks");
            overall += severity * 0.4;
        }

        if (negative > 1) {
            double severity = static_cast<double>(negative) / static_cast<double>(kRecentWindow);
            assessment.riskFactors.push_back({"Recent Negative Experiences", severity,
                fmt::format("{} negative experiences in the last {}", negative, kRecentWindow)});
            assessment.mitigationStrategies.push_back(
                "Review set and setting factors that may have contributed to negative experiences");
            overall += severity * 0.3;
        }
    }

    assessment.overallRisk = std::clamp(overall, 0.0, 1.0);
    double risk = assessment.overallRisk;

    Insight insight;
    insight.id = "current-risk-assessment";
    insight.title = "Current Risk Level: " + levelName(risk);
    insight.description = "Based on recent activity patterns and experience history";
    insight.confidence = 0.8;
    insight.severity = severityForLevel(risk);
    insight.metadata = {{"overallRisk", risk}};
    result.insights.push_back(std::move(insight));

    for (std::size_t i = 0; i < assessment.mitigationStrategies.size(); ++i) {
        Recommendation recommendation;
        recommendation.id = "risk-mitigation-" + std::to_string(i + 1);
        recommendation.title = "Risk Mitigation";
        recommendation.description = assessment.mitigationStrategies[i];
        recommendation.priority = priorityForLevel(risk);
        recommendation.category = RecommendationCategory::Safety;
        result.recommendations.push_back(std::move(recommendation));
    }

    nlohmann::json factors = nlohmann::json::array();
    for (const auto& factor : assessment.riskFactors) {
        factors.push_back({{"name", factor.factor}, {"value", factor.severity}});
    }

    VisualizationData visualization;
    visualization.type = VisualizationType::Gauge;
    visualization.title = "Risk Assessment Dashboard";
    visualization.description = "Current risk level and contributing factors";
    visualization.data = {{"overallRisk", risk}, {"riskFactors", factors}};
    result.visualizations.push_back(std::move(visualization));

    result.riskAssessment = std::move(assessment);
    return result;
}

double PatternAnalyzer::pearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.empty()) {
        return 0.0;
    }

    double n = static_cast<double>(x.size());
    double meanX = 0.0;
    double meanY = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        meanX += x[i];
        meanY += y[i];
    }
    meanX /= n;
    meanY /= n;

    double numerator = 0.0;
    double sumSqX = 0.0;
    double sumSqY = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        double dx = x[i] - meanX;
        double dy = y[i] - meanY;
        numerator += dx * dy;
        sumSqX += dx * dx;
        sumSqY += dy * dy;
    }

    if (sumSqX == 0.0 || sumSqY == 0.0) {
        return 0.0;
    }
    return numerator / (std::sqrt(sumSqX) * std::sqrt(sumSqY));
}

int PatternAnalyzer::minimumSafeIntervalDays(const std::string& substanceName) {
    static const std::vector<std::pair<std::string, int>> table = {
        {"LSD", 14},
        {"Psilocybin", 14},
        {"Mescaline", 14},
        {"MDMA", 90},
        {"MDA", 90},
        {"DMT", 1},
        {"Nitrous", 1}
    };

    for (const auto& [name, days] : table) {
        if (containsIgnoreCase(substanceName, name)) {
            return days;
        }
    }
    return 7;
}

} // namespace journal::plugins

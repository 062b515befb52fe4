/**
 * @file PatternAnalyzer.hpp
 * @brief Statistical analyses over a user's experience history.
 *
 * All analyses are deterministic functions of the AnalyticsContext. Each
 * one skips experiences outside the context's time range, checks its stop
 * token between groups and returns what it has computed so far once a stop
 * is requested.
 */

#pragma once

#include "core/types/Analytics.hpp"

#include <set>
#include <stop_token>
#include <string>
#include <vector>

namespace journal::plugins {

/**
 * @brief The sub-analyses PatternAnalyzer::analyze() can run.
 */
enum class PatternAnalysis : int {
    Interactions = 0,
    Tolerance = 1,
    Quality = 2,
    Timing = 3,
    Risk = 4
};

class PatternAnalyzer {
public:
    /// Known dangerous pairs, matched as case-insensitive substrings.
    static const std::vector<std::pair<std::string, std::string>>& knownDangerousPairs();

    /**
     * @brief Runs the selected analyses and merges their results.
     * @param context The analysis input.
     * @param selection Analyses to run, in enum order.
     * @param stopToken Cooperative cancellation.
     * @return Union of the selected results.
     */
    static core::AnalyticsResult analyze(const core::AnalyticsContext& context,
                                         const std::set<PatternAnalysis>& selection = allAnalyses(),
                                         std::stop_token stopToken = {});

    static std::set<PatternAnalysis> allAnalyses();

    /**
     * @brief Flags substance combinations with mostly negative ratings and known dangerous pairs.
     *
     * Experiences are grouped by the set of substances taken together (two or
     * more). A group of at least two experiences whose share of ratings <= 2
     * exceeds 0.6 gets a HIGH insight (CRITICAL above 0.8) and a SAFETY
     * recommendation. Every group containing both members of a known
     * dangerous pair gets one CRITICAL insight.
     */
    static core::AnalyticsResult analyzeInteractions(const core::AnalyticsContext& context,
                                                     std::stop_token stopToken = {});

    /**
     * @brief Detects rising doses and doses that correlate with worse ratings.
     *
     * Per substance, doses are ordered by ingestion time. With three or more
     * doses, a share of consecutive increases above 20% that exceeds one half
     * signals tolerance buildup. With three or more (dose, rating) pairs, a
     * Pearson correlation below -0.3 signals that higher doses go with worse
     * experiences.
     */
    static core::AnalyticsResult analyzeTolerance(const core::AnalyticsContext& context,
                                                  std::stop_token stopToken = {});

    /**
     * @brief Relates ratings to the location of the experience.
     *
     * Needs five rated experiences, otherwise returns a single LOW
     * "insufficient-data" insight.
     */
    static core::AnalyticsResult analyzeQuality(const core::AnalyticsContext& context,
                                                std::stop_token stopToken = {});

    /**
     * @brief Compares the average interval between uses with a minimum safe interval.
     */
    static core::AnalyticsResult analyzeTiming(const core::AnalyticsContext& context,
                                               std::stop_token stopToken = {});

    /**
     * @brief Scores recent frequency, polydrug use and negative experiences.
     *
     * The reference time is the end of the context's time range, or the
     * latest dated experience. The overall score is clamped to [0, 1].
     */
    static core::AnalyticsResult assessRisk(const core::AnalyticsContext& context,
                                            std::stop_token stopToken = {});

    /**
     * @brief Pearson correlation coefficient.
     * @return Coefficient in [-1, 1]; 0.0 for mismatched sizes, empty input or zero variance.
     */
    static double pearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y);

    /**
     * @brief Minimum number of days recommended between uses of a substance.
     * @param substanceName Substance name, matched case-insensitively by substring.
     * @return Interval in days, 7 when no table entry matches.
     */
    static int minimumSafeIntervalDays(const std::string& substanceName);
};

} // namespace journal::plugins

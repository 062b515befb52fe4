/**
 * @file AnalyticsDispatcher.hpp
 * @brief Fan-out of capability invocations with failure isolation.
 */

#pragma once

#include "core/plugin/Capability.hpp"
#include "core/plugin/IPlugin.hpp"
#include "core/plugin/PluginResult.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace journal::infra {

/**
 * @brief A capability together with the plugin instance that provides it.
 *
 * Holding the owner keeps the plugin (and its module) alive for as long as
 * an invocation of the capability may still be running.
 */
struct CapabilityEntry {
    std::string pluginId;
    std::shared_ptr<core::IPlugin> owner;
    core::Capability capability;
};

/**
 * @brief A capability invocation that threw or did not finish in time.
 */
struct CapabilityFailure {
    std::string pluginId;
    std::string capabilityId;
    core::PluginError error;
};

/**
 * @brief Outcome of one analytics pass.
 *
 * results holds one entry per analyzer that completed, in capability
 * registration order; failures holds the rest.
 */
struct AnalyticsBatch {
    std::vector<core::AnalyticsResult> results;
    std::vector<CapabilityFailure> failures;

    /**
     * @brief Merges every result into one.
     * @return Combined result. The first risk assessment wins.
     */
    [[nodiscard]] core::AnalyticsResult combined() const;
};

struct ConversationalBatch {
    std::vector<core::ConversationalResponse> responses;
    std::vector<CapabilityFailure> failures;
};

struct VisualizationBatch {
    std::vector<core::RenderedVisualization> renderings;
    std::vector<CapabilityFailure> failures;
};

/**
 * @brief Invokes capabilities and isolates their failures.
 *
 * Analytics capabilities run concurrently, one thread each, with their own
 * copy of the context. An analyzer that misses the deadline is asked to stop
 * through its stop token and left to finish on its own; its result, if any,
 * is discarded.
 */
class AnalyticsDispatcher {
public:
    explicit AnalyticsDispatcher(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /**
     * @brief Runs every analytics capability against a context.
     * @param analyzers Entries in registration order. Non-analytics entries are ignored.
     * @param context The analysis input.
     * @return Completed results and failures.
     */
    [[nodiscard]] AnalyticsBatch dispatch(const std::vector<CapabilityEntry>& analyzers,
                                          const core::AnalyticsContext& context) const;

    /**
     * @brief Sends a query to every conversational capability in turn.
     */
    [[nodiscard]] ConversationalBatch query(const std::vector<CapabilityEntry>& handlers,
                                            const core::ConversationalQuery& query) const;

    /**
     * @brief Renders a chart with every visualization capability in turn.
     */
    [[nodiscard]] VisualizationBatch render(const std::vector<CapabilityEntry>& renderers,
                                            const core::VisualizationContext& context) const;

    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
    const std::chrono::milliseconds timeout_;
};

} // namespace journal::infra

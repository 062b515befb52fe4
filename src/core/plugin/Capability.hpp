/**
 * @file Capability.hpp
 * @brief Closed set of capability kinds a plugin can expose.
 *
 * Each capability kind wraps a distinct function signature. The host
 * dispatches by matching on the variant alternative, never by inspecting the
 * plugin's runtime type.
 */

#pragma once

#include "core/types/Analytics.hpp"

#include <functional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>

namespace journal::core {

/**
 * @brief Kinds of capability, one per Capability alternative.
 */
enum class CapabilityKind : int {
    Analytics = 0,      ///< Produces insights from an AnalyticsContext
    Visualization = 1,  ///< Renders a chart payload
    Conversational = 2  ///< Answers a query
};

/**
 * @brief Converts a capability kind to its string representation.
 * @param kind The kind to convert.
 * @return String representation of the kind.
 */
inline std::string capabilityKindToString(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Analytics: return "Analytics";
        case CapabilityKind::Visualization: return "Visualization";
        case CapabilityKind::Conversational: return "Conversational";
        default: return "Unknown";
    }
}

/**
 * @brief Analysis over historical records.
 *
 * The function receives a stop token and should return early, with whatever
 * it has computed, once a stop is requested.
 */
struct AnalyticsCapability {
    using AnalyzeFunction =
        std::function<AnalyticsResult(const AnalyticsContext&, std::stop_token)>;

    std::string id;
    std::string name;
    std::string description;
    AnalyzeFunction analyze;
};

struct VisualizationCapability {
    using RenderFunction = std::function<RenderedVisualization(const VisualizationContext&)>;

    std::string id;
    std::string name;
    std::string description;
    RenderFunction render;
};

struct ConversationalCapability {
    using ProcessFunction = std::function<ConversationalResponse(const ConversationalQuery&)>;

    std::string id;
    std::string name;
    std::string description;
    ProcessFunction process;
};

using Capability = std::variant<AnalyticsCapability, VisualizationCapability, ConversationalCapability>;

/**
 * @brief Gets the kind of a capability.
 */
inline CapabilityKind capabilityKind(const Capability& capability) {
    return static_cast<CapabilityKind>(capability.index());
}

/**
 * @brief Gets the id shared by every capability alternative.
 */
inline const std::string& capabilityId(const Capability& capability) {
    return std::visit([](const auto& c) -> const std::string& { return c.id; }, capability);
}

/**
 * @brief Gets the display name shared by every capability alternative.
 */
inline const std::string& capabilityName(const Capability& capability) {
    return std::visit([](const auto& c) -> const std::string& { return c.name; }, capability);
}

} // namespace journal::core

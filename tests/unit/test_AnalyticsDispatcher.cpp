#include <catch2/catch_test_macros.hpp>

#include "infrastructure/plugin/AnalyticsDispatcher.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace journal::core;
using namespace journal::infra;

namespace {

CapabilityEntry analyzerEntry(const std::string& pluginId, const std::string& id,
                              AnalyticsCapability::AnalyzeFunction analyze) {
    return CapabilityEntry{pluginId, nullptr, AnalyticsCapability{id, id, "", std::move(analyze)}};
}

AnalyticsResult resultWithInsight(const std::string& id) {
    AnalyticsResult result;
    Insight insight;
    insight.id = id;
    result.insights.push_back(insight);
    return result;
}

AnalyticsContext contextWithExperiences(std::size_t count) {
    AnalyticsContext context;
    context.experiences.resize(count);
    return context;
}

} // namespace

TEST_CASE("AnalyticsDispatcher collects results", "[AnalyticsDispatcher]") {
    AnalyticsDispatcher dispatcher(std::chrono::milliseconds(2000));

    SECTION("No analyzers yields an empty batch") {
        auto batch = dispatcher.dispatch({}, contextWithExperiences(3));

        REQUIRE(batch.results.empty());
        REQUIRE(batch.failures.empty());
    }

    SECTION("Results keep registration order") {
        std::vector<CapabilityEntry> entries;
        for (int i = 0; i < 4; ++i) {
            auto id = "analyzer-" + std::to_string(i);
            entries.push_back(analyzerEntry("plugin", id, [id, i](const AnalyticsContext&, std::stop_token) {
                std::this_thread::sleep_for(std::chrono::milliseconds(40 - i * 10));
                return resultWithInsight(id);
            }));
        }

        auto batch = dispatcher.dispatch(entries, contextWithExperiences(1));

        REQUIRE(batch.failures.empty());
        REQUIRE(batch.results.size() == 4);
        for (int i = 0; i < 4; ++i) {
            REQUIRE(batch.results[i].insights[0].id == "analyzer-" + std::to_string(i));
        }
    }

    SECTION("Concurrent dispatches share the configured timeout") {
        std::vector<CapabilityEntry> entries{
            analyzerEntry("plugin", "quick", [](const AnalyticsContext&, std::stop_token) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return resultWithInsight("quick");
            })
        };

        std::atomic<int> completed{0};
        std::vector<std::thread> callers;
        for (int i = 0; i < 4; ++i) {
            callers.emplace_back([&]() {
                auto batch = dispatcher.dispatch(entries, contextWithExperiences(1));
                if (batch.results.size() == 1 && batch.failures.empty()) {
                    ++completed;
                }
            });
        }
        for (auto& caller : callers) {
            caller.join();
        }

        REQUIRE(completed == 4);
        REQUIRE(dispatcher.timeout() == std::chrono::milliseconds(2000));
    }

    SECTION("Analyzers see the caller's context") {
        std::atomic<std::size_t> seen{0};
        std::vector<CapabilityEntry> entries{
            analyzerEntry("plugin", "counter", [&seen](const AnalyticsContext& context, std::stop_token) {
                seen = context.experiences.size();
                return AnalyticsResult{};
            })
        };

        auto batch = dispatcher.dispatch(entries, contextWithExperiences(7));

        REQUIRE(batch.results.size() == 1);
        REQUIRE(seen == 7);
    }

    SECTION("Non-analytics capabilities are skipped") {
        std::vector<CapabilityEntry> entries{
            CapabilityEntry{"plugin", nullptr, ConversationalCapability{"chat", "Chat", "", nullptr}},
            analyzerEntry("plugin", "real", [](const AnalyticsContext&, std::stop_token) {
                return resultWithInsight("real");
            })
        };

        auto batch = dispatcher.dispatch(entries, contextWithExperiences(0));

        REQUIRE(batch.results.size() == 1);
        REQUIRE(batch.failures.empty());
    }
}

TEST_CASE("AnalyticsDispatcher isolates failures", "[AnalyticsDispatcher]") {
    SECTION("A throwing analyzer is reported and the rest still run") {
        AnalyticsDispatcher dispatcher(std::chrono::milliseconds(2000));
        std::vector<CapabilityEntry> entries{
            analyzerEntry("good", "first", [](const AnalyticsContext&, std::stop_token) {
                return resultWithInsight("first");
            }),
            analyzerEntry("bad", "broken", [](const AnalyticsContext&, std::stop_token) -> AnalyticsResult {
                throw std::runtime_error("division by zero");
            }),
            analyzerEntry("good", "second", [](const AnalyticsContext&, std::stop_token) {
                return resultWithInsight("second");
            })
        };

        auto batch = dispatcher.dispatch(entries, contextWithExperiences(1));

        REQUIRE(batch.results.size() == 2);
        REQUIRE(batch.results[0].insights[0].id == "first");
        REQUIRE(batch.results[1].insights[0].id == "second");
        REQUIRE(batch.failures.size() == 1);
        REQUIRE(batch.failures[0].pluginId == "bad");
        REQUIRE(batch.failures[0].capabilityId == "broken");
        REQUIRE(batch.failures[0].error.code == PluginErrorCode::AnalyzerFailed);
        REQUIRE(batch.failures[0].error.message.find("division by zero") != std::string::npos);
    }

    SECTION("A slow analyzer times out and is asked to stop") {
        AnalyticsDispatcher dispatcher(std::chrono::milliseconds(100));
        auto stopped = std::make_shared<std::atomic<bool>>(false);

        std::vector<CapabilityEntry> entries{
            analyzerEntry("slow", "sleeper", [stopped](const AnalyticsContext&, std::stop_token token) {
                auto giveUp = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                while (!token.stop_requested() && std::chrono::steady_clock::now() < giveUp) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                *stopped = token.stop_requested();
                return AnalyticsResult{};
            }),
            analyzerEntry("fast", "quick", [](const AnalyticsContext&, std::stop_token) {
                return resultWithInsight("quick");
            })
        };

        auto start = std::chrono::steady_clock::now();
        auto batch = dispatcher.dispatch(entries, contextWithExperiences(1));
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(elapsed < std::chrono::seconds(2));
        REQUIRE(batch.results.size() == 1);
        REQUIRE(batch.results[0].insights[0].id == "quick");
        REQUIRE(batch.failures.size() == 1);
        REQUIRE(batch.failures[0].capabilityId == "sleeper");
        REQUIRE(batch.failures[0].error.code == PluginErrorCode::AnalyzerFailed);

        auto waitUntil = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!*stopped && std::chrono::steady_clock::now() < waitUntil) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        REQUIRE(*stopped);
    }
}

TEST_CASE("AnalyticsBatch combined result", "[AnalyticsDispatcher]") {
    AnalyticsBatch batch;

    AnalyticsResult first = resultWithInsight("a");
    first.riskAssessment = RiskAssessment{0.3, {}, {}};
    AnalyticsResult second = resultWithInsight("b");
    second.riskAssessment = RiskAssessment{0.9, {}, {}};
    second.recommendations.push_back(Recommendation{});
    batch.results = {first, second};

    auto combined = batch.combined();

    REQUIRE(combined.insights.size() == 2);
    REQUIRE(combined.recommendations.size() == 1);
    REQUIRE(combined.riskAssessment.has_value());
    REQUIRE(combined.riskAssessment->overallRisk == 0.3);
}

TEST_CASE("AnalyticsDispatcher sequential kinds", "[AnalyticsDispatcher]") {
    AnalyticsDispatcher dispatcher;

    SECTION("Conversational handlers answer in order and failures are collected") {
        std::vector<CapabilityEntry> entries{
            CapabilityEntry{"p", nullptr, ConversationalCapability{"echo", "Echo", "",
                [](const ConversationalQuery& query) {
                    return ConversationalResponse{"echo: " + query.query, 1.0, {}, {}};
                }}},
            CapabilityEntry{"p", nullptr, ConversationalCapability{"broken", "Broken", "",
                [](const ConversationalQuery&) -> ConversationalResponse {
                    throw std::runtime_error("offline");
                }}}
        };

        auto batch = dispatcher.query(entries, ConversationalQuery{"hello", {}, {}});

        REQUIRE(batch.responses.size() == 1);
        REQUIRE(batch.responses[0].response == "echo: hello");
        REQUIRE(batch.failures.size() == 1);
        REQUIRE(batch.failures[0].capabilityId == "broken");
    }

    SECTION("Visualization renderers") {
        std::vector<CapabilityEntry> entries{
            CapabilityEntry{"p", nullptr, VisualizationCapability{"svg", "SVG", "",
                [](const VisualizationContext& context) {
                    return RenderedVisualization{"image/svg+xml", "<svg>" + context.data.title + "</svg>"};
                }}}
        };
        VisualizationContext context;
        context.data.title = "Chart";

        auto batch = dispatcher.render(entries, context);

        REQUIRE(batch.failures.empty());
        REQUIRE(batch.renderings.size() == 1);
        REQUIRE(batch.renderings[0].content == "<svg>Chart</svg>");
    }

    SECTION("Non-standard exceptions are collected too") {
        std::vector<CapabilityEntry> handlers{
            CapabilityEntry{"p", nullptr, ConversationalCapability{"odd", "Odd", "",
                [](const ConversationalQuery&) -> ConversationalResponse {
                    throw 42;
                }}}
        };
        std::vector<CapabilityEntry> renderers{
            CapabilityEntry{"p", nullptr, VisualizationCapability{"odd", "Odd", "",
                [](const VisualizationContext&) -> RenderedVisualization {
                    throw "no renderer";
                }}}
        };

        auto answered = dispatcher.query(handlers, ConversationalQuery{"hello", {}, {}});
        auto rendered = dispatcher.render(renderers, VisualizationContext{});

        REQUIRE(answered.responses.empty());
        REQUIRE(answered.failures.size() == 1);
        REQUIRE(answered.failures[0].error.code == PluginErrorCode::AnalyzerFailed);
        REQUIRE(rendered.renderings.empty());
        REQUIRE(rendered.failures.size() == 1);
        REQUIRE(rendered.failures[0].capabilityId == "odd");
    }
}

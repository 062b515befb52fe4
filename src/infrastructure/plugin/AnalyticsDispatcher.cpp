#include "infrastructure/plugin/AnalyticsDispatcher.hpp"

#include <exception>
#include <future>
#include <optional>
#include <stop_token>
#include <thread>
#include <spdlog/spdlog.h>

namespace journal::infra {

using core::PluginErrorCode;

namespace {

struct Invocation {
    std::promise<core::AnalyticsResult> promise;
    std::stop_source stopSource;
};

CapabilityFailure makeFailure(const CapabilityEntry& entry, std::string message) {
    spdlog::warn("Capability {}/{} failed: {}", entry.pluginId,
        core::capabilityId(entry.capability), message);
    return CapabilityFailure{
        entry.pluginId,
        core::capabilityId(entry.capability),
        core::PluginError{PluginErrorCode::AnalyzerFailed, std::move(message)}
    };
}

} // namespace

core::AnalyticsResult AnalyticsBatch::combined() const {
    core::AnalyticsResult merged;
    for (const auto& result : results) {
        merged.merge(result);
    }
    return merged;
}

AnalyticsDispatcher::AnalyticsDispatcher(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

AnalyticsBatch AnalyticsDispatcher::dispatch(const std::vector<CapabilityEntry>& analyzers,
                                             const core::AnalyticsContext& context) const {
    std::vector<const CapabilityEntry*> entries;
    std::vector<std::shared_ptr<Invocation>> invocations;
    std::vector<std::future<core::AnalyticsResult>> futures;
    std::vector<std::thread> workers;

    for (const auto& entry : analyzers) {
        const auto* capability = std::get_if<core::AnalyticsCapability>(&entry.capability);
        if (!capability || !capability->analyze) {
            continue;
        }

        auto invocation = std::make_shared<Invocation>();
        futures.push_back(invocation->promise.get_future());
        entries.push_back(&entry);
        invocations.push_back(invocation);

        // Each worker owns a copy of the entry (and so the plugin) and of the context.
        workers.emplace_back([invocation, entry, context]() {
            const auto& analyze = std::get<core::AnalyticsCapability>(entry.capability).analyze;
            try {
                invocation->promise.set_value(analyze(context, invocation->stopSource.get_token()));
            } catch (...) {
                invocation->promise.set_exception(std::current_exception());
            }
        });
    }

    spdlog::debug("Dispatched {} analyzers over {} experiences", workers.size(), context.experiences.size());

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::vector<std::optional<core::AnalyticsResult>> completed(workers.size());
    AnalyticsBatch batch;

    for (std::size_t i = 0; i < workers.size(); ++i) {
        if (futures[i].wait_until(deadline) != std::future_status::ready) {
            invocations[i]->stopSource.request_stop();
            workers[i].detach();
            batch.failures.push_back(makeFailure(*entries[i],
                "Timed out after " + std::to_string(timeout_.count()) + " ms"));
            continue;
        }

        workers[i].join();
        try {
            completed[i] = futures[i].get();
        } catch (const std::exception& e) {
            batch.failures.push_back(makeFailure(*entries[i], std::string("Threw: ") + e.what()));
        } catch (...) {
            batch.failures.push_back(makeFailure(*entries[i], "Threw a non-standard exception"));
        }
    }

    for (auto& result : completed) {
        if (result) {
            batch.results.push_back(std::move(*result));
        }
    }
    return batch;
}

ConversationalBatch AnalyticsDispatcher::query(const std::vector<CapabilityEntry>& handlers,
                                               const core::ConversationalQuery& query) const {
    ConversationalBatch batch;
    for (const auto& entry : handlers) {
        const auto* capability = std::get_if<core::ConversationalCapability>(&entry.capability);
        if (!capability || !capability->process) {
            continue;
        }
        try {
            batch.responses.push_back(capability->process(query));
        } catch (const std::exception& e) {
            batch.failures.push_back(makeFailure(entry, std::string("Threw: ") + e.what()));
        } catch (...) {
            batch.failures.push_back(makeFailure(entry, "Threw a non-standard exception"));
        }
    }
    return batch;
}

VisualizationBatch AnalyticsDispatcher::render(const std::vector<CapabilityEntry>& renderers,
                                               const core::VisualizationContext& context) const {
    VisualizationBatch batch;
    for (const auto& entry : renderers) {
        const auto* capability = std::get_if<core::VisualizationCapability>(&entry.capability);
        if (!capability || !capability->render) {
            continue;
        }
        try {
            batch.renderings.push_back(capability->render(context));
        } catch (const std::exception& e) {
            batch.failures.push_back(makeFailure(entry, std::string("Threw: ") + e.what()));
        } catch (...) {
            batch.failures.push_back(makeFailure(entry, "Threw a non-standard exception"));
        }
    }
    return batch;
}

} // namespace journal::infra

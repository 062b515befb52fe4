#include "PatternRecognitionPlugin.hpp"
#include "PatternAnalyzer.hpp"

namespace journal::plugins {

core::PluginManifest PatternRecognitionPlugin::makeManifest(const std::string& entryPoint) {
    core::PluginManifest manifest;
    manifest.id = kPluginId;
    manifest.name = "Smart Pattern Recognition";
    manifest.version = "1.0.0";
    manifest.description = "Analysis of substance interactions, tolerance, experience quality, timing and risk";
    manifest.author = "Journal Core";
    manifest.permissions = {
        core::Permission::ReadExperiences,
        core::Permission::ReadSubstances,
        core::Permission::AnalyticsAccess
    };
    manifest.entryPoint = entryPoint;
    return manifest;
}

PatternRecognitionPlugin::PatternRecognitionPlugin()
    : manifest_(makeManifest()) {
}

PatternRecognitionPlugin::~PatternRecognitionPlugin() {
    if (running_) {
        shutdown();
    }
}

bool PatternRecognitionPlugin::initialize(core::IPluginContext* context) {
    if (!context) {
        return false;
    }

    context_ = context;
    running_ = true;
    context_->logInfo("Pattern recognition ready, host version " + context_->appVersion());
    return true;
}

bool PatternRecognitionPlugin::shutdown() {
    if (context_) {
        context_->logInfo("Pattern recognition shutting down after " +
            std::to_string(analysesRun()) + " analyses");
    }
    running_ = false;
    context_ = nullptr;
    return true;
}

std::vector<core::Capability> PatternRecognitionPlugin::getCapabilities() const {
    return {
        makeCapability("substance-interaction-detection", "Substance Interaction Detection",
            "Detect potentially dangerous substance combinations",
            &PatternAnalyzer::analyzeInteractions),
        makeCapability("tolerance-tracking", "Personal Tolerance Tracking",
            "Track tolerance patterns and dose effects",
            &PatternAnalyzer::analyzeTolerance),
        makeCapability("experience-quality-correlation", "Experience Quality Correlation",
            "Identify settings that lead to positive or negative experiences",
            &PatternAnalyzer::analyzeQuality),
        makeCapability("timing-optimization", "Timing Pattern Analysis",
            "Compare usage intervals with recommended minimums",
            &PatternAnalyzer::analyzeTiming),
        makeCapability("risk-assessment", "Risk Assessment",
            "Aggregate risk score from recent activity",
            &PatternAnalyzer::assessRisk)
    };
}

std::string PatternRecognitionPlugin::statusMessage() const {
    if (!running_) {
        return "Stopped";
    }
    return "Running - " + std::to_string(analysesRun()) + " analyses";
}

int64_t PatternRecognitionPlugin::analysesRun() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return analysesRun_;
}

core::AnalyticsCapability PatternRecognitionPlugin::makeCapability(
    const std::string& id, const std::string& name, const std::string& description,
    core::AnalyticsCapability::AnalyzeFunction analyze) const {

    return core::AnalyticsCapability{
        id, name, description,
        [this, analyze = std::move(analyze)](const core::AnalyticsContext& context, std::stop_token stopToken) {
            recordRun();
            return analyze(context, stopToken);
        }
    };
}

void PatternRecognitionPlugin::recordRun() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    analysesRun_++;
}

} // namespace journal::plugins

extern "C" {

journal::core::IPlugin* journal_create_plugin() {
    return new journal::plugins::PatternRecognitionPlugin();
}

void journal_destroy_plugin(journal::core::IPlugin* plugin) {
    delete plugin;
}

}

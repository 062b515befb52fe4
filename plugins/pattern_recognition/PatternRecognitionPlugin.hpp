#pragma once

#include "core/plugin/IPlugin.hpp"
#include "core/plugin/IPluginContext.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace journal::plugins {

/**
 * @brief Reference analytics plugin exposing the PatternAnalyzer analyses.
 *
 * Exposes one analytics capability per analysis. The capabilities capture
 * this instance, so they are only valid while the plugin is loaded.
 */
class PatternRecognitionPlugin : public core::IPlugin {
public:
    static constexpr const char* kPluginId = "smart-pattern-recognition";
    static constexpr const char* kBuiltinName = "pattern-recognition";

    /**
     * @brief Builds the manifest shipped with this plugin.
     * @param entryPoint Entry point to record, "builtin:pattern-recognition" or a module name.
     * @return The manifest.
     */
    static core::PluginManifest makeManifest(const std::string& entryPoint = "builtin:pattern-recognition");

    PatternRecognitionPlugin();
    ~PatternRecognitionPlugin() override;

    [[nodiscard]] const core::PluginManifest& manifest() const override { return manifest_; }

    bool initialize(core::IPluginContext* context) override;
    bool shutdown() override;

    [[nodiscard]] std::vector<core::Capability> getCapabilities() const override;
    [[nodiscard]] std::string statusMessage() const override;

    [[nodiscard]] int64_t analysesRun() const;

private:
    core::AnalyticsCapability makeCapability(const std::string& id, const std::string& name,
                                             const std::string& description,
                                             core::AnalyticsCapability::AnalyzeFunction analyze) const;
    void recordRun() const;

    core::PluginManifest manifest_;
    core::IPluginContext* context_{nullptr};
    std::atomic<bool> running_{false};

    mutable std::mutex statsMutex_;
    mutable int64_t analysesRun_{0};
};

} // namespace journal::plugins

extern "C" {
    journal::core::IPlugin* journal_create_plugin();
    void journal_destroy_plugin(journal::core::IPlugin* plugin);
}

#include "app/Application.hpp"

#include "pattern_recognition/PatternRecognitionPlugin.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace journal::app {

namespace {

void printError(const core::PluginError& error) {
    std::cerr << "error: " << error.toString() << "\n";
}

} // namespace

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        std::cerr << "warning: using default configuration, " << config_->configPath().string()
                  << " could not be read\n";
    }

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");
    pluginManager_.reset();
}

void Application::initializeLogging() {
    const auto& cfg = config_->config();

    // Command output goes to stdout, so the log stays on stderr.
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    std::vector<spdlog::sink_ptr> sinks{consoleSink};

    if (!cfg.logFile.empty()) {
        try {
            auto fileSink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.logFile, 5 * 1024 * 1024, 3);
            fileSink->set_level(spdlog::level::debug);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "warning: cannot open log file " << cfg.logFile << ": " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("journal", sinks.begin(), sinks.end());
    auto level = spdlog::level::from_str(cfg.logLevel);
    consoleSink->set_level(level);
    logger->set_level(std::min(level, spdlog::level::debug));
    spdlog::set_default_logger(logger);

    spdlog::debug("Journal plugin host {} starting...", kVersion);
}

void Application::initializeComponents() {
    // Host services
    preferences_ = std::make_shared<infra::JsonPreferenceStore>(config_->preferencesPath());
    records_ = std::make_shared<infra::InMemoryJournalRepository>();
    notifications_ = std::make_shared<infra::LogNotificationService>();

    // Compiled-in plugins
    builtins_ = std::make_shared<infra::BuiltinPluginRegistry>();
    builtins_->registerFactory(plugins::PatternRecognitionPlugin::kBuiltinName, []() {
        return std::make_unique<plugins::PatternRecognitionPlugin>();
    });

    infra::PluginHostServices services{records_, preferences_, notifications_};
    pluginManager_ = std::make_unique<infra::PluginManager>(
        config_->pluginManagerConfig(kVersion), services, builtins_);
    pluginManager_->start(config_->config().autoLoadEnabled);

    spdlog::debug("Application components initialized");
}

int Application::run(const std::string& command, const std::vector<std::string>& args) {
    if (command == "list") return listPlugins();
    if (command == "pack") return packPlugin(args);
    if (command == "install") return installPlugin(args);
    if (command == "uninstall") return uninstallPlugin(args);
    if (command == "enable") return setPluginEnabled(args, true);
    if (command == "disable") return setPluginEnabled(args, false);
    if (command == "analyze") return analyze(args);

    std::cerr << "error: unknown command '" << command << "'\n";
    printUsage();
    return 64;
}

void Application::printUsage() {
    std::cerr <<
        "usage: journal-plugin-host [--config <dir>] <command> [args]\n"
        "\n"
        "commands:\n"
        "  list                                      list installed plugins\n"
        "  pack <manifest.json> [module...] -o <out> build a plugin package\n"
        "  install <package>                         install, enable and load a package\n"
        "  uninstall <id>                            remove an installed plugin\n"
        "  enable <id>                               enable and load a plugin\n"
        "  disable <id>                              disable and unload a plugin\n"
        "  analyze <records.json>                    run every analytics capability\n";
}

int Application::listPlugins() {
    auto plugins = pluginManager_->installedPlugins();
    if (plugins.empty()) {
        std::cout << "No plugins installed\n";
        return 0;
    }

    for (const auto& info : plugins) {
        std::cout << info.manifest.fullId() << "  " << info.manifest.name
                  << "  [" << (info.isEnabled ? "enabled" : "disabled")
                  << ", " << (info.isLoaded ? "loaded" : "not loaded") << "]";
        if (info.error) {
            std::cout << "  error: " << *info.error;
        }
        std::cout << "\n";
    }
    return 0;
}

int Application::packPlugin(const std::vector<std::string>& args) {
    std::string manifestPath;
    std::string outputPath;
    std::vector<std::string> modulePaths;

    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-o" || args[i] == "--output") {
            if (i + 1 >= args.size()) {
                std::cerr << "error: " << args[i] << " needs a path\n";
                return 64;
            }
            outputPath = args[++i];
        } else if (manifestPath.empty()) {
            manifestPath = args[i];
        } else {
            modulePaths.push_back(args[i]);
        }
    }

    if (manifestPath.empty() || outputPath.empty()) {
        printUsage();
        return 64;
    }

    nlohmann::json manifestJson;
    try {
        std::ifstream file(manifestPath);
        if (!file) {
            std::cerr << "error: cannot open " << manifestPath << "\n";
            return 66;
        }
        file >> manifestJson;
    } catch (const std::exception& e) {
        std::cerr << "error: " << manifestPath << " is not valid JSON: " << e.what() << "\n";
        return 65;
    }

    auto manifest = core::PluginManifest::fromJson(manifestJson);
    if (!manifest) {
        printError(manifest.error());
        return 65;
    }

    std::map<std::string, infra::Bytes> modules;
    for (const auto& modulePath : modulePaths) {
        std::ifstream file(modulePath, std::ios::binary);
        if (!file) {
            std::cerr << "error: cannot open " << modulePath << "\n";
            return 66;
        }
        modules[std::filesystem::path(modulePath).filename().string()] =
            infra::Bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    auto package = infra::PluginPackage::create(manifest.value(), std::move(modules));
    auto bytes = package.serialize();

    std::ofstream out(outputPath, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        std::cerr << "error: cannot write " << outputPath << "\n";
        return 73;
    }

    std::cout << "Packed " << manifest.value().fullId() << " into " << outputPath << "\n";
    return 0;
}

int Application::installPlugin(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return 64;
    }

    auto plugin = pluginManager_->installFromFile(args[0]);
    if (!plugin) {
        printError(plugin.error());
        return 1;
    }

    std::cout << "Installed " << plugin.value()->manifest().fullId() << "\n";
    return 0;
}

int Application::uninstallPlugin(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return 64;
    }

    auto result = pluginManager_->uninstall(args[0]);
    if (!result) {
        printError(result.error());
        return 1;
    }

    std::cout << "Uninstalled " << args[0] << "\n";
    return 0;
}

int Application::setPluginEnabled(const std::vector<std::string>& args, bool enabled) {
    if (args.size() != 1) {
        printUsage();
        return 64;
    }

    auto result = enabled ? pluginManager_->enable(args[0]) : pluginManager_->disable(args[0]);
    if (!result) {
        printError(result.error());
        return 1;
    }

    std::cout << (enabled ? "Enabled " : "Disabled ") << args[0] << "\n";
    return 0;
}

int Application::analyze(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        printUsage();
        return 64;
    }

    if (!records_->loadFromFile(args[0])) {
        std::cerr << "error: cannot read records from " << args[0] << "\n";
        return 66;
    }

    core::AnalyticsContext context;
    context.experiences = records_->getExperiences();
    context.substances = records_->getSubstances();

    auto batch = pluginManager_->executeAnalytics(context);

    nlohmann::json output;
    output["result"] = batch.combined().toJson();
    output["failures"] = nlohmann::json::array();
    for (const auto& failure : batch.failures) {
        output["failures"].push_back({
            {"pluginId", failure.pluginId},
            {"capabilityId", failure.capabilityId},
            {"error", failure.error.toString()}
        });
    }

    std::cout << output.dump(2) << "\n";
    return 0;
}

} // namespace journal::app

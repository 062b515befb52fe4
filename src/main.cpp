#include "app/Application.hpp"

#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>

namespace {

std::filesystem::path defaultConfigDir() {
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) / ".journal-core" : std::filesystem::path(".journal-core");
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path configDir = defaultConfigDir();
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (command.empty() && (arg == "--help" || arg == "-h")) {
            journal::app::Application::printUsage();
            return 0;
        }
        if (command.empty() && arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "error: --config needs a directory\n";
                return 64;
            }
            configDir = argv[++i];
        } else if (command.empty()) {
            command = arg;
        } else {
            args.push_back(arg);
        }
    }

    if (command.empty()) {
        journal::app::Application::printUsage();
        return 64;
    }

    try {
        journal::app::Application app(configDir);
        return app.run(command, args);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

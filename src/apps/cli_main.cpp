// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/config/CliConfigParser.hpp"
#include "fs_maintenance/config/ScratchConfig.hpp"
#include "fs_maintenance/runtime/PathResolver.hpp"
#include "fs_maintenance/services/StaleSweeper.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

using fs_maintenance::config::ScratchConfig;
using fs_maintenance::config::loadScratchConfigFromYaml;
using fs_maintenance::config::parseConfigPath;
using fs_maintenance::config::parseResolveArguments;
using fs_maintenance::runtime::PathResolver;
using fs_maintenance::services::StaleSweeper;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  sweep <config.yaml>                             - Delete stale files from the scratch roots\n";
    std::cout << "  resolve <config.yaml> <global|tenant> [subdir]  - Print (and create) a scratch directory\n";
}

bool loadConfig(const std::string& path, ScratchConfig& config) {
    try {
        config = loadScratchConfigFromYaml(path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return false;
    }

    const auto errors = config.validate();
    for (const auto& err : errors) {
        std::cerr << "Config error: " << err << "\n";
    }
    return errors.empty();
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try {
        if (command == "sweep") {
            std::string config_path;
            try {
                config_path = parseConfigPath(args);
            } catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                printUsage(argv[0]);
                return 1;
            }

            ScratchConfig config;
            if (!loadConfig(config_path, config)) {
                return 1;
            }

            PathResolver resolver(config);
            StaleSweeper sweeper(resolver);
            std::cout << fs_maintenance::services::formatSweepSummary(sweeper.sweepStaleTempFiles()) << "\n";

        } else if (command == "resolve") {
            fs_maintenance::config::ResolveArguments parsed;
            try {
                parsed = parseResolveArguments(args);
            } catch (const std::exception& e) {
                std::cerr << e.what() << "\n";
                printUsage(argv[0]);
                return 1;
            }

            ScratchConfig config;
            if (!loadConfig(parsed.config_path, config)) {
                return 1;
            }

            PathResolver resolver(config);
            std::cout << resolver.resolveScratchRoot(parsed.kind, parsed.subdirectory) << "\n";

        } else {
            std::cerr << "Error: Unknown command '" << command << "'\n";
            printUsage(argv[0]);
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

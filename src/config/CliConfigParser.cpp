// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/config/CliConfigParser.hpp"

#include <stdexcept>

namespace fs_maintenance::config {

std::string parseConfigPath(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        throw std::invalid_argument("Expected exactly one configuration path argument");
    }
    if (args.front().empty()) {
        throw std::invalid_argument("Configuration path must not be empty");
    }
    return args.front();
}

ResolveArguments parseResolveArguments(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        throw std::invalid_argument("Expected <config.yaml> <global|tenant> [subdirectory]");
    }
    if (args[0].empty()) {
        throw std::invalid_argument("Configuration path must not be empty");
    }

    ResolveArguments parsed;
    parsed.config_path = args[0];
    parsed.kind = runtime::parseScratchRootKind(args[1]);
    if (args.size() == 3) {
        parsed.subdirectory = args[2];
    }
    return parsed;
}

}  // namespace fs_maintenance::config

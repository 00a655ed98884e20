// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_CONFIG_CLI_CONFIG_PARSER_HPP
#define FS_MAINTENANCE_CONFIG_CLI_CONFIG_PARSER_HPP

#include <string>
#include <vector>

#include "fs_maintenance/runtime/PathResolver.hpp"

namespace fs_maintenance::config {

struct ResolveArguments {
    std::string config_path;
    runtime::ScratchRootKind kind = runtime::ScratchRootKind::Global;
    std::string subdirectory;
};

std::string parseConfigPath(const std::vector<std::string>& args);

// <config.yaml> <global|tenant> [subdirectory]
ResolveArguments parseResolveArguments(const std::vector<std::string>& args);

}  // namespace fs_maintenance::config

#endif  // FS_MAINTENANCE_CONFIG_CLI_CONFIG_PARSER_HPP

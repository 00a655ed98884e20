// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/config/ScratchConfig.hpp"

#include <yaml-cpp/yaml.h>

namespace fs_maintenance::config {

namespace {

YAML::Node extractParameterNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return YAML::Node();
    }

    for (const char* key : {"scratch_sweeper_node", "fs_maintenance"}) {
        if (root[key]) {
            auto node = root[key];
            if (node["ros__parameters"]) {
                return node["ros__parameters"];
            }
            return node;
        }
    }

    if (root["ros__parameters"]) {
        return root["ros__parameters"];
    }

    return root;
}

template <typename T>
T readOrDefault(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (!node || !node[key]) {
        return default_value;
    }
    return node[key].as<T>();
}

bool isAppRelative(const std::string& path) {
    return !path.empty() && path.front() == '~';
}

}  // namespace

ScratchConfig loadScratchConfigFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    YAML::Node params = extractParameterNode(root);

    ScratchConfig config;
    config.app_root = readOrDefault<std::string>(params, "app_root", config.app_root);
    config.temp_directory = readOrDefault<std::string>(params, "temp_directory", config.temp_directory);
    config.tenant_path = readOrDefault<std::string>(params, "tenant_path", config.tenant_path);
    return config;
}

std::vector<std::string> ScratchConfig::validate() const {
    std::vector<std::string> errors;
    if (temp_directory.empty()) {
        errors.emplace_back("temp_directory is empty");
    }
    if (tenant_path.empty()) {
        errors.emplace_back("tenant_path is empty");
    }
    if (!app_root.empty() && app_root.front() == '~') {
        errors.emplace_back("app_root must not be application-relative: " + app_root);
    }
    if (isAppRelative(temp_directory) && temp_directory.size() > 1 && temp_directory[1] != '/') {
        errors.emplace_back("temp_directory must start with \"~/\": " + temp_directory);
    }
    if (isAppRelative(tenant_path) && tenant_path.size() > 1 && tenant_path[1] != '/') {
        errors.emplace_back("tenant_path must start with \"~/\": " + tenant_path);
    }
    return errors;
}

}  // namespace fs_maintenance::config

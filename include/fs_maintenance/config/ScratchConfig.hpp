// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_CONFIG_SCRATCH_CONFIG_HPP
#define FS_MAINTENANCE_CONFIG_SCRATCH_CONFIG_HPP

#include <string>
#include <vector>

namespace fs_maintenance::config {

inline constexpr const char* kDefaultTempDirectory = "~/App_Data/_temp";
inline constexpr const char* kDefaultTenantPath = "~/App_Data/Tenants/Default";

struct ScratchConfig {
    // Base for "~/" and relative paths. Empty means the working directory.
    std::string app_root;
    std::string temp_directory = kDefaultTempDirectory;
    // The tenant scratch root is <tenant_path>/_temp.
    std::string tenant_path = kDefaultTenantPath;

    std::vector<std::string> validate() const;
};

ScratchConfig loadScratchConfigFromYaml(const std::string& path);

}  // namespace fs_maintenance::config

#endif  // FS_MAINTENANCE_CONFIG_SCRATCH_CONFIG_HPP

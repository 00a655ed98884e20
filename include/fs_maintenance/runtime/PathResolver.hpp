// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_RUNTIME_PATH_RESOLVER_HPP
#define FS_MAINTENANCE_RUNTIME_PATH_RESOLVER_HPP

#include <string>

#include "fs_maintenance/config/ScratchConfig.hpp"

namespace fs_maintenance::runtime {

enum class ScratchRootKind {
    Global,
    Tenant
};

ScratchRootKind parseScratchRootKind(const std::string& text);
std::string scratchRootKindToString(ScratchRootKind kind);

// Resolves scratch roots to physical directories, creating them on demand.
// Creation failures are not suppressed: std::filesystem::filesystem_error
// propagates to the caller.
class PathResolver {
public:
    explicit PathResolver(config::ScratchConfig config);
    ~PathResolver() = default;

    std::string resolveScratchRoot(ScratchRootKind kind, const std::string& subdirectory = "") const;

    std::string tempDir(const std::string& subdirectory = "") const {
        return resolveScratchRoot(ScratchRootKind::Global, subdirectory);
    }

    std::string tenantTempDir(const std::string& subdirectory = "") const {
        return resolveScratchRoot(ScratchRootKind::Tenant, subdirectory);
    }

    // Physical base path for kind, without touching the filesystem.
    std::string basePath(ScratchRootKind kind) const;

    // Maps "~/x" and relative paths onto the application root.
    std::string mapPath(const std::string& virtual_path) const;

    const config::ScratchConfig& config() const {
        return config_;
    }

private:
    config::ScratchConfig config_;
};

}  // namespace fs_maintenance::runtime

#endif  // FS_MAINTENANCE_RUNTIME_PATH_RESOLVER_HPP

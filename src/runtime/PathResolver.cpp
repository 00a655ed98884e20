// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/runtime/PathResolver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fs_maintenance::runtime {

namespace {

constexpr const char* kTenantTempSuffix = "_temp";

void ensureDirectory(const std::filesystem::path& path) {
    if (!std::filesystem::is_directory(path)) {
        std::filesystem::create_directories(path);
    }
}

}  // namespace

ScratchRootKind parseScratchRootKind(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "global") {
        return ScratchRootKind::Global;
    }
    if (lowered == "tenant") {
        return ScratchRootKind::Tenant;
    }
    throw std::invalid_argument("Unknown scratch root kind: " + text);
}

std::string scratchRootKindToString(ScratchRootKind kind) {
    switch (kind) {
        case ScratchRootKind::Global:
            return "global";
        case ScratchRootKind::Tenant:
            return "tenant";
    }
    return "unknown";
}

PathResolver::PathResolver(config::ScratchConfig config)
    : config_(std::move(config)) {}

std::string PathResolver::mapPath(const std::string& virtual_path) const {
    std::string relative = virtual_path;
    if (!relative.empty() && relative.front() == '~') {
        relative.erase(0, 1);
        while (!relative.empty() && (relative.front() == '/' || relative.front() == '\\')) {
            relative.erase(0, 1);
        }
    } else if (std::filesystem::path(relative).is_absolute()) {
        return std::filesystem::path(relative).lexically_normal().string();
    }

    const std::filesystem::path root = config_.app_root.empty()
        ? std::filesystem::current_path()
        : std::filesystem::path(config_.app_root);
    if (relative.empty()) {
        return root.lexically_normal().string();
    }
    return (root / relative).lexically_normal().string();
}

std::string PathResolver::basePath(ScratchRootKind kind) const {
    if (kind == ScratchRootKind::Tenant) {
        return (std::filesystem::path(mapPath(config_.tenant_path)) / kTenantTempSuffix).string();
    }
    return mapPath(config_.temp_directory);
}

std::string PathResolver::resolveScratchRoot(ScratchRootKind kind, const std::string& subdirectory) const {
    std::filesystem::path path(basePath(kind));
    ensureDirectory(path);

    if (!subdirectory.empty()) {
        path /= subdirectory;
        ensureDirectory(path);
    }

    return path.string();
}

}  // namespace fs_maintenance::runtime

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <filesystem>

#include "ScratchTestUtils.hpp"
#include "fs_maintenance/runtime/PathResolver.hpp"

using fs_maintenance::config::ScratchConfig;
using fs_maintenance::runtime::PathResolver;
using fs_maintenance::runtime::ScratchRootKind;
using fs_maintenance::test::ScopedTempDir;
using fs_maintenance::test::writeFile;

namespace {

ScratchConfig configFor(const ScopedTempDir& dir) {
    ScratchConfig config;
    config.app_root = dir.path().string();
    config.temp_directory = "~/App_Data/_temp";
    config.tenant_path = "~/App_Data/Tenants/Default";
    return config;
}

}  // namespace

TEST(PathResolverTest, MapsAppRelativePaths) {
    ScopedTempDir dir;
    PathResolver resolver(configFor(dir));

    EXPECT_EQ((dir.path() / "App_Data/_temp").string(), resolver.mapPath("~/App_Data/_temp"));
    EXPECT_EQ((dir.path() / "logs").string(), resolver.mapPath("logs"));
    EXPECT_EQ("/var/tmp/x", resolver.mapPath("/var/tmp/x"));
}

TEST(PathResolverTest, CreatesGlobalRootOnDemand) {
    ScopedTempDir dir;
    PathResolver resolver(configFor(dir));
    const auto expected = dir.path() / "App_Data" / "_temp";
    ASSERT_FALSE(std::filesystem::exists(expected));

    const auto resolved = resolver.tempDir();

    EXPECT_EQ(expected.string(), resolved);
    EXPECT_TRUE(std::filesystem::is_directory(resolved));
}

TEST(PathResolverTest, TenantRootLivesUnderTenantPath) {
    ScopedTempDir dir;
    PathResolver resolver(configFor(dir));

    const auto resolved = resolver.resolveScratchRoot(ScratchRootKind::Tenant);

    EXPECT_EQ((dir.path() / "App_Data" / "Tenants" / "Default" / "_temp").string(), resolved);
    EXPECT_TRUE(std::filesystem::is_directory(resolved));
}

TEST(PathResolverTest, CreatesSubdirectory) {
    ScopedTempDir dir;
    PathResolver resolver(configFor(dir));

    const auto first = resolver.tenantTempDir("uploads");
    const auto second = resolver.tenantTempDir("uploads");

    EXPECT_EQ(first, second);
    EXPECT_EQ("uploads", std::filesystem::path(first).filename().string());
    EXPECT_TRUE(std::filesystem::is_directory(first));
}

TEST(PathResolverTest, CreationFailurePropagates) {
    ScopedTempDir dir;
    // A regular file where the scratch root should go.
    writeFile(dir.path() / "App_Data" / "_temp", "not a directory");
    PathResolver resolver(configFor(dir));

    EXPECT_THROW(resolver.tempDir(), std::filesystem::filesystem_error);
}

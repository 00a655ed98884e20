// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>

#include "ScratchTestUtils.hpp"
#include "fs_maintenance/runtime/PathResolver.hpp"
#include "fs_maintenance/services/StaleSweeper.hpp"

using fs_maintenance::config::ScratchConfig;
using fs_maintenance::runtime::PathResolver;
using fs_maintenance::services::StaleSweeper;
using fs_maintenance::test::RecordingSink;
using fs_maintenance::test::ScopedTempDir;
using fs_maintenance::test::setAge;
using fs_maintenance::test::setLinkAge;
using fs_maintenance::test::writeFile;

class StaleSweeperTest : public ::testing::Test {
protected:
    StaleSweeperTest()
        : resolver_(makeConfig()) {}

    ScratchConfig makeConfig() const {
        ScratchConfig config;
        config.app_root = dir_.path().string();
        config.temp_directory = "~/temp";
        config.tenant_path = "~/tenant";
        return config;
    }

    ScopedTempDir dir_;
    RecordingSink recorder_;
    PathResolver resolver_;
};

TEST_F(StaleSweeperTest, DeletesOnlyFilesOlderThanRetention) {
    const auto root = std::filesystem::path(resolver_.tempDir());
    writeFile(root / "old.tmp");
    writeFile(root / "recent.tmp");
    setAge(root / "old.tmp", std::chrono::hours(6));
    setAge(root / "recent.tmp", std::chrono::hours(1));

    StaleSweeper sweeper(resolver_, recorder_.sink());
    const auto summary = sweeper.sweepStaleTempFiles();

    EXPECT_FALSE(std::filesystem::exists(root / "old.tmp"));
    EXPECT_TRUE(std::filesystem::exists(root / "recent.tmp"));
    EXPECT_EQ(2u, summary.roots_swept);
    EXPECT_EQ(2u, summary.files_scanned);
    EXPECT_EQ(1u, summary.files_deleted);
    EXPECT_EQ(0u, summary.failures);
}

TEST_F(StaleSweeperTest, SweepsTenantRootToo) {
    const auto tenant_root = std::filesystem::path(resolver_.tenantTempDir());
    writeFile(tenant_root / "export.zip");
    setAge(tenant_root / "export.zip", std::chrono::hours(24));

    StaleSweeper sweeper(resolver_, recorder_.sink());
    sweeper.sweepStaleTempFiles();

    EXPECT_FALSE(std::filesystem::exists(tenant_root / "export.zip"));
}

TEST_F(StaleSweeperTest, DoesNotRecurseIntoSubdirectories) {
    const auto root = std::filesystem::path(resolver_.tempDir());
    writeFile(root / "job" / "old.tmp");
    setAge(root / "job" / "old.tmp", std::chrono::hours(48));
    setAge(root / "job", std::chrono::hours(48));

    StaleSweeper sweeper(resolver_, recorder_.sink());
    sweeper.sweepStaleTempFiles();

    EXPECT_TRUE(std::filesystem::exists(root / "job" / "old.tmp"));
}

TEST_F(StaleSweeperTest, FailingRootDoesNotStopOtherRoot) {
    // Block the global root with a regular file so its resolution throws.
    writeFile(dir_.path() / "temp", "blocker");
    const auto tenant_root = std::filesystem::path(resolver_.tenantTempDir());
    writeFile(tenant_root / "old.tmp");
    setAge(tenant_root / "old.tmp", std::chrono::hours(6));

    StaleSweeper sweeper(resolver_, recorder_.sink());
    const auto summary = sweeper.sweepStaleTempFiles();

    EXPECT_FALSE(std::filesystem::exists(tenant_root / "old.tmp"));
    EXPECT_EQ(1u, summary.roots_swept);
    EXPECT_EQ(1u, summary.failures);
    ASSERT_EQ(1u, recorder_.diagnostics.size());
    EXPECT_EQ("resolve global scratch root", recorder_.diagnostics[0].operation);
}

TEST(StaleSweeperSummaryTest, FormatsCounters) {
    fs_maintenance::services::SweepSummary summary;
    summary.roots_swept = 2;
    summary.files_scanned = 10;
    summary.files_deleted = 3;
    summary.failures = 1;

    const auto text = fs_maintenance::services::formatSweepSummary(summary);
    EXPECT_NE(std::string::npos, text.find("Files deleted    : 3"));
    EXPECT_NE(std::string::npos, text.find("Failures         : 1"));
}

TEST_F(StaleSweeperTest, DanglingSymlinkAgesOut) {
    const auto root = std::filesystem::path(resolver_.tempDir());
    const auto old_link = root / "old.lnk";
    const auto new_link = root / "new.lnk";
    std::filesystem::create_symlink(root / "gone", old_link);
    std::filesystem::create_symlink(root / "gone", new_link);
    setLinkAge(old_link, std::chrono::hours(6));
    setLinkAge(new_link, std::chrono::hours(1));

    StaleSweeper sweeper(resolver_, recorder_.sink());
    const auto summary = sweeper.sweepStaleTempFiles();

    EXPECT_FALSE(std::filesystem::is_symlink(std::filesystem::symlink_status(old_link)));
    EXPECT_TRUE(std::filesystem::is_symlink(std::filesystem::symlink_status(new_link)));
    EXPECT_EQ(1u, summary.files_deleted);
    EXPECT_EQ(0u, summary.failures);
}

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "fs_maintenance/config/CliConfigParser.hpp"

using fs_maintenance::config::parseConfigPath;
using fs_maintenance::config::parseResolveArguments;
using fs_maintenance::runtime::ScratchRootKind;

TEST(CliConfigParserTest, ExtractsPathFromSingleArgument) {
    std::vector<std::string> args = {"config.yaml"};
    EXPECT_EQ("config.yaml", parseConfigPath(args));
}

TEST(CliConfigParserTest, RejectsMissingArgument) {
    std::vector<std::string> args;
    EXPECT_THROW(parseConfigPath(args), std::invalid_argument);
}

TEST(CliConfigParserTest, RejectsExtraArguments) {
    std::vector<std::string> args = {"one.yaml", "two.yaml"};
    EXPECT_THROW(parseConfigPath(args), std::invalid_argument);
}

TEST(CliConfigParserTest, ParsesResolveArguments) {
    const auto parsed = parseResolveArguments({"config.yaml", "Tenant", "uploads"});
    EXPECT_EQ("config.yaml", parsed.config_path);
    EXPECT_EQ(ScratchRootKind::Tenant, parsed.kind);
    EXPECT_EQ("uploads", parsed.subdirectory);

    const auto global = parseResolveArguments({"config.yaml", "global"});
    EXPECT_EQ(ScratchRootKind::Global, global.kind);
    EXPECT_TRUE(global.subdirectory.empty());
}

TEST(CliConfigParserTest, RejectsUnknownScratchRootKind) {
    EXPECT_THROW(parseResolveArguments({"config.yaml", "shared"}), std::invalid_argument);
    EXPECT_THROW(parseResolveArguments({"config.yaml"}), std::invalid_argument);
    EXPECT_THROW(parseResolveArguments({"", "global"}), std::invalid_argument);
}

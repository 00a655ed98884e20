// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/common/NameAllocator.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <system_error>

namespace fs_maintenance::common {

namespace {

std::mt19937_64& generator() {
    thread_local std::mt19937_64 engine{[] {
        std::random_device device;
        return (static_cast<uint64_t>(device()) << 32) ^ device();
    }()};
    return engine;
}

bool pathExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

}  // namespace

std::string generateUniqueToken() {
    std::array<uint8_t, 16> bytes{};
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(dist(generator()));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    constexpr const char* kHex = "0123456789abcdef";
    std::string token;
    token.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            token.push_back('-');
        }
        token.push_back(kHex[bytes[i] >> 4]);
        token.push_back(kHex[bytes[i] & 0x0F]);
    }
    return token;
}

std::string allocateUniqueName(const std::string& parent_directory, const std::string& desired_name) {
    const std::string base = desired_name.empty() ? generateUniqueToken() : desired_name;

    std::error_code ec;
    if (parent_directory.empty() || !std::filesystem::is_directory(parent_directory, ec)) {
        return base;
    }

    const std::filesystem::path parent(parent_directory);
    std::string candidate = base;
    for (int suffix = 1; suffix < kMaxNameProbes && pathExists(parent / candidate); ++suffix) {
        candidate = base + std::to_string(suffix);
    }
    return candidate;
}

}  // namespace fs_maintenance::common

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_COMMON_NAME_ALLOCATOR_HPP
#define FS_MAINTENANCE_COMMON_NAME_ALLOCATOR_HPP

#include <string>

namespace fs_maintenance::common {

inline constexpr int kMaxNameProbes = 999999;

// Random version 4 UUID in canonical 8-4-4-4-12 hex form.
std::string generateUniqueToken();

// Returns a name that does not exist under parent_directory: desired_name,
// or desired_name followed by the smallest free numeric suffix. An empty
// desired_name is replaced by generateUniqueToken(). When parent_directory is
// empty or missing the base name is returned unchanged.
std::string allocateUniqueName(const std::string& parent_directory, const std::string& desired_name = "");

}  // namespace fs_maintenance::common

#endif  // FS_MAINTENANCE_COMMON_NAME_ALLOCATOR_HPP

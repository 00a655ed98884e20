// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_SERVICES_STALE_SWEEPER_HPP
#define FS_MAINTENANCE_SERVICES_STALE_SWEEPER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "fs_maintenance/io/SafeFileOps.hpp"
#include "fs_maintenance/runtime/PathResolver.hpp"
#include "fs_maintenance/utils/Diagnostics.hpp"

namespace fs_maintenance::services {

struct SweepSummary {
    std::size_t roots_swept = 0;
    std::size_t files_scanned = 0;
    std::size_t files_deleted = 0;
    std::size_t failures = 0;
};

std::string formatSweepSummary(const SweepSummary& summary);

// Deletes non-directory entries older than the retention window from the top
// level of the global and tenant scratch roots.
class StaleSweeper {
public:
    static constexpr std::chrono::hours kRetentionWindow{5};

    StaleSweeper(const runtime::PathResolver& resolver, utils::DiagnosticSink sink = {});

    // A failure on one root never stops the sweep of the other.
    SweepSummary sweepStaleTempFiles() const;

private:
    void sweepDirectory(const std::filesystem::path& directory,
                        std::chrono::system_clock::time_point cutoff,
                        SweepSummary& summary) const;

    const runtime::PathResolver& resolver_;
    io::SafeFileOps ops_;
};

}  // namespace fs_maintenance::services

#endif  // FS_MAINTENANCE_SERVICES_STALE_SWEEPER_HPP

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/services/StaleSweeper.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs_maintenance::services {

namespace {

// Modification time of the entry itself; symlinks are not followed, so a
// dangling link still ages out.
bool entryLastWriteTime(const std::filesystem::path& path,
                        std::chrono::system_clock::time_point& last_write,
                        std::error_code& ec) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        ec.assign(errno, std::generic_category());
        return false;
    }
    const auto since_epoch = std::chrono::seconds(st.st_mtim.tv_sec) + std::chrono::nanoseconds(st.st_mtim.tv_nsec);
    last_write = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
    ec.clear();
    return true;
}

}  // namespace

std::string formatSweepSummary(const SweepSummary& summary) {
    std::ostringstream oss;
    oss << "Stale sweep summary:\n"
        << "  Roots swept      : " << summary.roots_swept << "\n"
        << "  Files scanned    : " << summary.files_scanned << "\n"
        << "  Files deleted    : " << summary.files_deleted << "\n"
        << "  Failures         : " << summary.failures;
    return oss.str();
}

StaleSweeper::StaleSweeper(const runtime::PathResolver& resolver, utils::DiagnosticSink sink)
    : resolver_(resolver),
      ops_(std::move(sink)) {}

SweepSummary StaleSweeper::sweepStaleTempFiles() const {
    SweepSummary summary;

    for (const auto kind : {runtime::ScratchRootKind::Global, runtime::ScratchRootKind::Tenant}) {
        std::string root;
        try {
            root = resolver_.resolveScratchRoot(kind);
        } catch (const std::filesystem::filesystem_error& e) {
            ops_.report("resolve " + runtime::scratchRootKindToString(kind) + " scratch root",
                        e.path1().string(), e.what());
            ++summary.failures;
            continue;
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(root, ec)) {
            continue;
        }

        const auto cutoff = std::chrono::system_clock::now() - kRetentionWindow;
        sweepDirectory(root, cutoff, summary);
        ++summary.roots_swept;
    }

    return summary;
}

void StaleSweeper::sweepDirectory(const std::filesystem::path& directory,
                                  std::chrono::system_clock::time_point cutoff,
                                  SweepSummary& summary) const {
    std::error_code ec;
    std::vector<std::filesystem::path> files;

    std::filesystem::directory_iterator it(directory, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!std::filesystem::is_directory(it->symlink_status(type_ec))) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        ops_.report("list", directory.string(), ec.message());
        ++summary.failures;
        return;
    }

    for (const auto& file : files) {
        ++summary.files_scanned;

        std::chrono::system_clock::time_point last_write;
        if (!entryLastWriteTime(file, last_write, ec)) {
            ops_.report("stat", file.string(), ec.message());
            ++summary.failures;
            continue;
        }
        if (last_write >= cutoff) {
            continue;
        }

        try {
            if (ops_.deleteFile(file.string())) {
                ++summary.files_deleted;
            } else {
                ++summary.failures;
            }
        } catch (const io::AccessDeniedError& e) {
            // Replaced by a directory since the listing.
            ops_.report("delete", file.string(), e.what());
            ++summary.failures;
        }
    }
}

}  // namespace fs_maintenance::services

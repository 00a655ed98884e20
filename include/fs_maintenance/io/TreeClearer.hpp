// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_IO_TREE_CLEARER_HPP
#define FS_MAINTENANCE_IO_TREE_CLEARER_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "fs_maintenance/utils/Diagnostics.hpp"

namespace fs_maintenance::io {

// Removes a single file or empty directory. Returns false and sets ec on failure.
using RemoveFunction = std::function<bool(const std::filesystem::path&, std::error_code&)>;

// Best-effort recursive emptying of a directory.
//
// Every file and subdirectory gets two removal attempts separated by a
// scheduler yield. Entries that survive both are left in place and the walk
// moves on. Nothing is ever thrown to the caller; failures go to the sink.
class TreeClearer {
public:
    explicit TreeClearer(utils::DiagnosticSink sink = {}, RemoveFunction remove = {});

    // except_names protects files directly under path (case-insensitive).
    // Nested files with the same names are removed.
    void clearDirectory(const std::string& path,
                        bool remove_self,
                        const std::vector<std::string>& except_names = {}) const;

    static constexpr int kRemoveAttempts = 2;

private:
    enum class EntryKind {
        File,
        Directory
    };

    void clearContents(const std::filesystem::path& directory,
                       const std::vector<std::string>& except_names) const;
    std::optional<std::vector<std::filesystem::path>> listEntries(const std::filesystem::path& directory,
                                                                  EntryKind kind) const;
    bool removeWithRetry(const std::filesystem::path& path) const;
    void report(const std::string& operation, const std::string& path, const std::string& message) const;

    utils::DiagnosticSink sink_;
    RemoveFunction remove_;
};

}  // namespace fs_maintenance::io

#endif  // FS_MAINTENANCE_IO_TREE_CLEARER_HPP

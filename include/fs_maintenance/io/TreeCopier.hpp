// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_IO_TREE_COPIER_HPP
#define FS_MAINTENANCE_IO_TREE_COPIER_HPP

#include <filesystem>
#include <string>

#include "fs_maintenance/io/SafeFileOps.hpp"
#include "fs_maintenance/utils/Diagnostics.hpp"
#include "fs_maintenance/utils/OpResult.hpp"

namespace fs_maintenance::io {

// Recursive directory copy that keeps going past failed entries.
class TreeCopier {
public:
    explicit TreeCopier(utils::DiagnosticSink sink = {});

    // Fails without touching anything when the textual target path contains
    // the textual source path. Otherwise copies as much as possible and
    // succeeds only if every entry was copied.
    OpResult copyDirectory(const std::string& source, const std::string& target, bool overwrite = true) const;

    static bool targetInsideSource(const std::string& source, const std::string& target);

private:
    OpResult copyTree(const std::filesystem::path& source,
                      const std::filesystem::path& target,
                      bool overwrite) const;

    SafeFileOps ops_;
};

}  // namespace fs_maintenance::io

#endif  // FS_MAINTENANCE_IO_TREE_COPIER_HPP

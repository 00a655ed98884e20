// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_IO_SAFE_FILE_OPS_HPP
#define FS_MAINTENANCE_IO_SAFE_FILE_OPS_HPP

#include <stdexcept>
#include <string>

#include "fs_maintenance/utils/Diagnostics.hpp"
#include "fs_maintenance/utils/OpResult.hpp"

namespace fs_maintenance::io {

// Raised when a caller asks for something this layer refuses to do,
// such as removing a directory through deleteFile().
class AccessDeniedError : public std::runtime_error {
public:
    explicit AccessDeniedError(const std::string& message)
        : std::runtime_error(message) {}
};

// Single-file primitives. Every I/O failure is reported to the sink and
// returned as a failed OpResult.
class SafeFileOps {
public:
    explicit SafeFileOps(utils::DiagnosticSink sink = {});

    // Succeeds for an empty or missing path. Throws AccessDeniedError when
    // path is a directory.
    OpResult deleteFile(const std::string& path) const;

    OpResult copyFile(const std::string& source,
                      const std::string& destination,
                      bool overwrite = true,
                      bool delete_source = false) const;

    // Rewrites path with zero bytes. Failures are only reported to the sink.
    void truncateFile(const std::string& path) const;

    // Number of direct non-directory entries, 0 when the directory cannot be listed.
    int countFiles(const std::string& directory) const;

    void report(const std::string& operation, const std::string& path, const std::string& message) const;

    const utils::DiagnosticSink& sink() const {
        return sink_;
    }

private:
    utils::DiagnosticSink sink_;
};

}  // namespace fs_maintenance::io

#endif  // FS_MAINTENANCE_IO_SAFE_FILE_OPS_HPP

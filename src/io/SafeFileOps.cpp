// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/io/SafeFileOps.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs_maintenance::io {

SafeFileOps::SafeFileOps(utils::DiagnosticSink sink)
    : sink_(utils::sinkOrDefault(std::move(sink))) {}

void SafeFileOps::report(const std::string& operation,
                         const std::string& path,
                         const std::string& message) const {
    sink_(utils::Diagnostic{operation, path, message});
}

OpResult SafeFileOps::deleteFile(const std::string& path) const {
    if (path.empty()) {
        return OpResult::ok();
    }

    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::symlink_status(path, ec))) {
        throw AccessDeniedError("Deleting directories is not permitted through deleteFile: " + path);
    }

    // A missing file is not an error.
    std::filesystem::remove(path, ec);
    if (ec) {
        report("delete", path, ec.message());
        return OpResult::failure("Failed to delete " + path + ": " + ec.message());
    }
    return OpResult::ok();
}

OpResult SafeFileOps::copyFile(const std::string& source,
                               const std::string& destination,
                               bool overwrite,
                               bool delete_source) const {
    const auto options = overwrite
        ? std::filesystem::copy_options::overwrite_existing
        : std::filesystem::copy_options::none;

    std::error_code ec;
    std::filesystem::copy_file(source, destination, options, ec);
    if (ec) {
        report("copy", source + " -> " + destination, ec.message());
        return OpResult::failure("Failed to copy " + source + " to " + destination + ": " + ec.message());
    }

    if (!delete_source) {
        return OpResult::ok();
    }

    try {
        return deleteFile(source);
    } catch (const AccessDeniedError& e) {
        report("delete", source, e.what());
        return OpResult::failure(e.what());
    }
}

void SafeFileOps::truncateFile(const std::string& path) const {
    if (path.empty()) {
        return;
    }

    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        report("truncate", path, "cannot open file for writing");
        return;
    }
    ofs.close();
    if (ofs.fail()) {
        report("truncate", path, "failed to flush file");
    }
}

int SafeFileOps::countFiles(const std::string& directory) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        report("count", directory, ec.message());
        return 0;
    }

    int count = 0;
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!std::filesystem::is_directory(it->symlink_status(type_ec))) {
            ++count;
        }
    }
    if (ec) {
        report("count", directory, ec.message());
        return 0;
    }
    return count;
}

}  // namespace fs_maintenance::io

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/io/TreeCopier.hpp"

#include <system_error>
#include <utility>
#include <vector>

#include "fs_maintenance/utils/ErrorAccumulator.hpp"

namespace fs_maintenance::io {

namespace {

std::string fullName(const std::string& path) {
    std::error_code ec;
    std::filesystem::path full = std::filesystem::absolute(path, ec);
    if (ec) {
        full = std::filesystem::path(path);
    }
    std::string text = full.lexically_normal().string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

}  // namespace

TreeCopier::TreeCopier(utils::DiagnosticSink sink)
    : ops_(std::move(sink)) {}

bool TreeCopier::targetInsideSource(const std::string& source, const std::string& target) {
    // Plain substring test, so "/data/foobar" counts as inside "/data/foo".
    return fullName(target).find(fullName(source)) != std::string::npos;
}

OpResult TreeCopier::copyDirectory(const std::string& source, const std::string& target, bool overwrite) const {
    if (targetInsideSource(source, target)) {
        const std::string message = "Cannot copy a directory into itself: " + target;
        ops_.report("copy directory", source, message);
        return OpResult::failure(message);
    }
    return copyTree(source, target, overwrite);
}

OpResult TreeCopier::copyTree(const std::filesystem::path& source,
                              const std::filesystem::path& target,
                              bool overwrite) const {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    std::vector<std::filesystem::path> directories;
    std::vector<std::filesystem::path> unsupported;

    // Symlinks are followed: a link to a directory is copied as a directory.
    std::filesystem::directory_iterator it(source, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        const auto status = it->status(type_ec);
        if (std::filesystem::is_directory(status)) {
            directories.push_back(it->path());
        } else if (std::filesystem::is_regular_file(status)) {
            files.push_back(it->path());
        } else {
            unsupported.push_back(it->path());
        }
    }
    if (ec) {
        ops_.report("list", source.string(), ec.message());
        return OpResult::failure("Failed to list " + source.string() + ": " + ec.message());
    }

    std::filesystem::create_directories(target, ec);
    if (ec) {
        ops_.report("create directory", target.string(), ec.message());
        return OpResult::failure("Failed to create " + target.string() + ": " + ec.message());
    }

    utils::ErrorAccumulator errors;
    for (const auto& entry : unsupported) {
        ops_.report("copy", entry.string(), "unsupported entry type");
        errors.add("Cannot copy " + entry.string() + ": unsupported entry type");
    }

    for (const auto& file : files) {
        errors.add(ops_.copyFile(file.string(), (target / file.filename()).string(), overwrite));
    }

    for (const auto& directory : directories) {
        const auto target_subdir = target / directory.filename();
        std::filesystem::create_directory(target_subdir, ec);
        if (ec) {
            ops_.report("create directory", target_subdir.string(), ec.message());
            errors.add("Failed to create " + target_subdir.string() + ": " + ec.message());
            continue;
        }
        errors.add(copyTree(directory, target_subdir, overwrite));
    }

    return errors.toResult();
}

}  // namespace fs_maintenance::io

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/io/TreeClearer.hpp"

#include <algorithm>
#include <cctype>
#include <thread>
#include <utility>

namespace fs_maintenance::io {

namespace {

bool equalsIgnoreCase(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

bool isExcepted(const std::string& name, const std::vector<std::string>& except_names) {
    return std::any_of(except_names.begin(), except_names.end(),
                       [&](const std::string& candidate) { return equalsIgnoreCase(candidate, name); });
}

bool removeEntry(const std::filesystem::path& path, std::error_code& ec) {
    std::filesystem::remove(path, ec);
    return !ec;
}

// Adds owner write permission to a regular file or real directory. Symlinks
// are left alone.
void clearReadOnly(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec || std::filesystem::is_symlink(status)) {
        return;
    }
    auto extra = std::filesystem::perms::owner_write;
    if (std::filesystem::is_directory(status)) {
        extra |= std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read;
    }
    if ((status.permissions() & extra) == extra) {
        return;
    }
    // A failure here surfaces through the removal attempt that follows.
    std::filesystem::permissions(path, extra, std::filesystem::perm_options::add, ec);
}

}  // namespace

TreeClearer::TreeClearer(utils::DiagnosticSink sink, RemoveFunction remove)
    : sink_(utils::sinkOrDefault(std::move(sink))),
      remove_(remove ? std::move(remove) : RemoveFunction(removeEntry)) {}

void TreeClearer::report(const std::string& operation,
                         const std::string& path,
                         const std::string& message) const {
    sink_(utils::Diagnostic{operation, path, message});
}

void TreeClearer::clearDirectory(const std::string& path,
                                 bool remove_self,
                                 const std::vector<std::string>& except_names) const {
    if (path.empty()) {
        return;
    }

    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
        report("clear", path, "not a directory");
        return;
    }

    clearContents(path, except_names);

    if (remove_self) {
        std::filesystem::remove_all(path, ec);
        if (ec) {
            report("remove directory", path, ec.message());
        }
    }
}

void TreeClearer::clearContents(const std::filesystem::path& directory,
                                const std::vector<std::string>& except_names) const {
    const auto files = listEntries(directory, EntryKind::File);
    if (!files) {
        return;
    }

    for (const auto& file : *files) {
        if (isExcepted(file.filename().string(), except_names)) {
            continue;
        }
        clearReadOnly(file);
        removeWithRetry(file);
    }

    const auto directories = listEntries(directory, EntryKind::Directory);
    if (!directories) {
        return;
    }

    for (const auto& subdirectory : *directories) {
        clearReadOnly(subdirectory);
        // The except list only applies at the top level.
        clearContents(subdirectory, {});
        removeWithRetry(subdirectory);
    }
}

std::optional<std::vector<std::filesystem::path>> TreeClearer::listEntries(const std::filesystem::path& directory,
                                                                           EntryKind kind) const {
    std::error_code ec;
    std::vector<std::filesystem::path> entries;

    std::filesystem::directory_iterator it(directory, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        const bool is_directory = std::filesystem::is_directory(it->symlink_status(type_ec));
        if (is_directory == (kind == EntryKind::Directory)) {
            entries.push_back(it->path());
        }
    }

    if (ec) {
        report("list", directory.string(), ec.message());
        return std::nullopt;
    }
    return entries;
}

bool TreeClearer::removeWithRetry(const std::filesystem::path& path) const {
    std::error_code ec;
    for (int attempt = 0; attempt < kRemoveAttempts; ++attempt) {
        if (attempt > 0) {
            std::this_thread::yield();
        }
        ec.clear();
        if (remove_(path, ec)) {
            return true;
        }
    }
    report("remove", path.string(), ec.message());
    return false;
}

}  // namespace fs_maintenance::io

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_UTILS_OP_RESULT_HPP
#define FS_MAINTENANCE_UTILS_OP_RESULT_HPP

#include <string>
#include <utility>

namespace fs_maintenance {

// Outcome of a best-effort operation. Failures never escape as exceptions;
// they land here instead.
struct OpResult {
    bool success = false;
    std::string error_message;

    static OpResult ok() {
        OpResult result;
        result.success = true;
        return result;
    }

    static OpResult failure(std::string message) {
        OpResult result;
        result.error_message = std::move(message);
        return result;
    }

    explicit operator bool() const {
        return success;
    }
};

}  // namespace fs_maintenance

#endif  // FS_MAINTENANCE_UTILS_OP_RESULT_HPP

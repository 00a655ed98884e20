// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_UTILS_ERROR_ACCUMULATOR_HPP
#define FS_MAINTENANCE_UTILS_ERROR_ACCUMULATOR_HPP

#include <cstddef>
#include <string>

#include "fs_maintenance/utils/OpResult.hpp"

namespace fs_maintenance::utils {

// Collects per-entry failures of a tree operation into one message.
class ErrorAccumulator {
public:
    void add(const std::string& message) {
        if (message.empty()) {
            return;
        }
        if (!messages_.empty()) {
            messages_ += "; ";
        }
        messages_ += message;
        ++count_;
    }

    void add(const OpResult& result) {
        if (!result.success) {
            add(result.error_message.empty() ? std::string("unknown error") : result.error_message);
        }
    }

    bool empty() const {
        return count_ == 0;
    }

    std::size_t count() const {
        return count_;
    }

    const std::string& str() const {
        return messages_;
    }

    OpResult toResult() const {
        return empty() ? OpResult::ok() : OpResult::failure(messages_);
    }

private:
    std::string messages_;
    std::size_t count_ = 0;
};

}  // namespace fs_maintenance::utils

#endif  // FS_MAINTENANCE_UTILS_ERROR_ACCUMULATOR_HPP

// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef FS_MAINTENANCE_UTILS_DIAGNOSTICS_HPP
#define FS_MAINTENANCE_UTILS_DIAGNOSTICS_HPP

#include <functional>
#include <string>

namespace fs_maintenance::utils {

// A failure that was caught and suppressed.
struct Diagnostic {
    std::string operation;
    std::string path;
    std::string message;
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

// Writes "Error: <operation> failed for <path>: <message>" to stderr.
DiagnosticSink stderrSink();

// Returns sink unchanged, or stderrSink() when it is empty.
DiagnosticSink sinkOrDefault(DiagnosticSink sink);

std::string formatDiagnostic(const Diagnostic& diagnostic);

}  // namespace fs_maintenance::utils

#endif  // FS_MAINTENANCE_UTILS_DIAGNOSTICS_HPP

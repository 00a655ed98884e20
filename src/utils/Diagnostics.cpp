// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "fs_maintenance/utils/Diagnostics.hpp"

#include <iostream>
#include <utility>

namespace fs_maintenance::utils {

std::string formatDiagnostic(const Diagnostic& diagnostic) {
    std::string text = diagnostic.operation.empty() ? std::string("operation") : diagnostic.operation;
    text += " failed";
    if (!diagnostic.path.empty()) {
        text += " for " + diagnostic.path;
    }
    if (!diagnostic.message.empty()) {
        text += ": " + diagnostic.message;
    }
    return text;
}

DiagnosticSink stderrSink() {
    return [](const Diagnostic& diagnostic) {
        std::cerr << "Error: " << formatDiagnostic(diagnostic) << std::endl;
    };
}

DiagnosticSink sinkOrDefault(DiagnosticSink sink) {
    if (!sink) {
        return stderrSink();
    }
    return sink;
}

}  // namespace fs_maintenance::utils

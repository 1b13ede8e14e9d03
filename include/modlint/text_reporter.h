#pragma once

#include <modlint/interfaces.h>

#include <string>

namespace modlint {

// Renders diagnostics grouped by file as plain text and as a JSON
// document. A project that failed validation renders as one global
// diagnostic.
class TextReporter : public Reporter {
public:
  Report Render(const ReviewOutcome &outcome,
                const AnalysisConfig &config) override;
};

std::string EscapeJsonString(const std::string &value);

// Diagnostic standing for a project that could not be validated.
Diagnostic DiagnosticForProjectError(const InvalidProjectError &error);

} // namespace modlint

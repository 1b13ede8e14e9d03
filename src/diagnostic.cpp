#include <modlint/diagnostic.h>

#include <algorithm>
#include <utility>

namespace modlint {

Diagnostic MakeError(std::string message, std::vector<std::string> details,
                     Range range) {
  Diagnostic diagnostic;
  diagnostic.message = std::move(message);
  diagnostic.details = std::move(details);
  diagnostic.range = range;
  diagnostic.location = DiagnosticLocation::kModule;
  diagnostic.capability = ErrorCapability::kVisitedModule;
  return diagnostic;
}

Diagnostic MakeErrorForModule(const std::filesystem::path &file_path,
                              std::string message,
                              std::vector<std::string> details, Range range) {
  auto diagnostic = MakeError(std::move(message), std::move(details), range);
  diagnostic.file_path = file_path;
  diagnostic.capability = ErrorCapability::kAnyModule;
  return diagnostic;
}

Diagnostic MakeManifestError(const std::filesystem::path &manifest_path,
                             std::string message,
                             std::vector<std::string> details, Range range) {
  auto diagnostic = MakeErrorForModule(manifest_path, std::move(message),
                                       std::move(details), range);
  diagnostic.location = DiagnosticLocation::kManifest;
  return diagnostic;
}

Diagnostic MakeReadmeError(const std::filesystem::path &readme_path,
                           std::string message,
                           std::vector<std::string> details, Range range) {
  auto diagnostic = MakeErrorForModule(readme_path, std::move(message),
                                       std::move(details), range);
  diagnostic.location = DiagnosticLocation::kReadme;
  return diagnostic;
}

Diagnostic MakeGlobalError(std::string message,
                           std::vector<std::string> details) {
  Diagnostic diagnostic;
  diagnostic.message = std::move(message);
  diagnostic.details = std::move(details);
  diagnostic.location = DiagnosticLocation::kGlobal;
  diagnostic.capability = ErrorCapability::kAnyModule;
  return diagnostic;
}

Diagnostic ToGeneralError(Diagnostic diagnostic) {
  if (diagnostic.capability == ErrorCapability::kVisitedModule) {
    diagnostic.capability = ErrorCapability::kAnyModule;
    if (diagnostic.file_path.empty()) {
      diagnostic.location = DiagnosticLocation::kGlobal;
    }
  }
  return diagnostic;
}

void SortDiagnostics(Diagnostics &diagnostics) {
  std::stable_sort(diagnostics.begin(), diagnostics.end(),
                   [](const Diagnostic &lhs, const Diagnostic &rhs) {
                     return RangeLess(lhs.range, rhs.range);
                   });
}

} // namespace modlint

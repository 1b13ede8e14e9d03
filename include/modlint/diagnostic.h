#pragma once

#include <modlint/syntax.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace modlint {

enum class DiagnosticLocation { kModule, kManifest, kReadme, kGlobal };

// kVisitedModule errors may only be attributed to the module being visited;
// the scheduler fills in their file. kAnyModule errors already name their
// target and may be emitted from project-level hooks.
enum class ErrorCapability { kVisitedModule, kAnyModule };

struct Diagnostic {
  std::string rule_name;
  std::string message;
  std::vector<std::string> details;
  Range range;
  DiagnosticLocation location = DiagnosticLocation::kModule;
  std::filesystem::path file_path;
  std::optional<ModuleName> module_name;
  ErrorCapability capability = ErrorCapability::kVisitedModule;
};

using Diagnostics = std::vector<Diagnostic>;

// Error against the module currently visited.
Diagnostic MakeError(std::string message, std::vector<std::string> details,
                     Range range);

// Error against a specific module; usable from project-level hooks.
Diagnostic MakeErrorForModule(const std::filesystem::path &file_path,
                              std::string message,
                              std::vector<std::string> details, Range range);

Diagnostic MakeManifestError(const std::filesystem::path &manifest_path,
                             std::string message,
                             std::vector<std::string> details, Range range);

Diagnostic MakeReadmeError(const std::filesystem::path &readme_path,
                           std::string message,
                           std::vector<std::string> details, Range range);

Diagnostic MakeGlobalError(std::string message,
                           std::vector<std::string> details);

// Drops the visited-module capability of an error produced outside of a
// module visit. Such an error has no module to attach to, so it becomes a
// global one.
Diagnostic ToGeneralError(Diagnostic diagnostic);

// Stable sort by (start row, start column, end row, end column).
void SortDiagnostics(Diagnostics &diagnostics);

} // namespace modlint

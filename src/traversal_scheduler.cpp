#include <modlint/traversal_scheduler.h>

namespace modlint {

const char *TraversalModeName(TraversalMode mode) {
  switch (mode) {
  case TraversalMode::kUnordered:
    return "unordered";
  case TraversalMode::kImportOrdered:
    return "import-ordered";
  }
  return "unordered";
}

const char *TraversalStateName(TraversalState state) {
  switch (state) {
  case TraversalState::kNotStarted:
    return "not-started";
  case TraversalState::kVisitingModule:
    return "visiting-module";
  case TraversalState::kFolding:
    return "folding";
  case TraversalState::kFinalEvaluation:
    return "final-evaluation";
  case TraversalState::kDone:
    return "done";
  }
  return "not-started";
}

Fingerprint FingerprintProjectInputs(const ValidProject &project) {
  Fingerprint fingerprint = 0;
  if (const auto &manifest = project.ProjectManifest()) {
    fingerprint = CombineFingerprints(fingerprint, FingerprintText(manifest->raw));
    fingerprint = CombineFingerprints(
        fingerprint, FingerprintText(manifest->path.generic_string()));
  }
  if (const auto &readme = project.ProjectReadme()) {
    fingerprint =
        CombineFingerprints(fingerprint, FingerprintText(readme->content));
  }
  for (const auto &[name, dependency] : project.Dependencies()) {
    fingerprint = CombineFingerprints(fingerprint, FingerprintText(name));
    fingerprint =
        CombineFingerprints(fingerprint, FingerprintText(dependency.version));
  }
  return fingerprint;
}

Fingerprint FingerprintModule(const Module &module) {
  const auto source = FingerprintText(module.source);
  return module.is_in_source_directories
             ? source
             : CombineFingerprints(source, FingerprintText("outside-sources"));
}

void AttributeToModule(Diagnostics &diagnostics, const Module &module) {
  for (auto &diagnostic : diagnostics) {
    if (diagnostic.capability != ErrorCapability::kVisitedModule) {
      continue;
    }
    diagnostic.file_path = module.path;
    diagnostic.module_name = module.Name();
    diagnostic.location = DiagnosticLocation::kModule;
  }
}

bool ShouldVisit(const RunOptions &options, const std::string &rule_name,
                 const Module &module) {
  if (options.target_filter == nullptr) {
    return true;
  }
  return options.target_filter->Includes(rule_name, module.path);
}

} // namespace modlint

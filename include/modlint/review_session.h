#pragma once

#include <modlint/rule.h>
#include <modlint/valid_project.h>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modlint {

struct ProjectInputs {
  std::vector<Module> modules;
  std::optional<Manifest> manifest;
  std::optional<Readme> readme;
  DependencySet dependencies;
};

struct ReviewOutcome {
  // Sorted by range across all rules.
  Diagnostics diagnostics;
  // Set when the project could not be validated; no rule ran.
  std::optional<InvalidProjectError> project_error;
  std::map<std::string, CacheStatistics> cache_statistics;

  bool IsClean() const { return diagnostics.empty() && !project_error; }
};

// Runs a fixed set of rules over successive versions of one project and
// keeps the incremental cache between runs.
class ReviewSession {
public:
  ReviewSession(std::vector<std::unique_ptr<Rule>> rules, RunOptions options);

  // Validates a complete module set, replacing the current project.
  std::optional<InvalidProjectError> Load(ProjectInputs inputs);

  // Replaces one module. A new path, a renamed module, a parse failure or a
  // change of imports leads to a full validation.
  std::optional<InvalidProjectError>
  ApplyModuleEdit(const std::filesystem::path &path, std::string source,
                  std::optional<SyntaxFile> ast);

  ReviewOutcome Run();

  // Rules of another configuration never see the previous cache.
  void ReplaceRules(std::vector<std::unique_ptr<Rule>> rules);

  // Takes effect on the next Run. Installing a different target filter
  // drops the cache, since skipped modules change what importers receive.
  void SetOptions(RunOptions options);
  const RunOptions &Options() const { return options_; }

  const std::optional<ValidProject> &Project() const { return project_; }
  const std::optional<InvalidProjectError> &ProjectError() const {
    return project_error_;
  }
  std::vector<std::string> RuleNames() const;

private:
  std::optional<InvalidProjectError> Validate(AnalysisCache cache);

  std::vector<std::unique_ptr<Rule>> rules_;
  RunOptions options_;
  std::shared_ptr<Logger> logger_;
  ProjectInputs inputs_;
  std::optional<ValidProject> project_;
  std::optional<InvalidProjectError> project_error_;
};

} // namespace modlint

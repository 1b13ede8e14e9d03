#pragma once

#include <modlint/analysis_cache.h>
#include <modlint/diagnostic.h>
#include <modlint/project.h>
#include <modlint/rule.h>
#include <modlint/syntax.h>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace modlint {

// What a rule learns about the file behind a module context.
struct ModuleKey {
  std::filesystem::path path;
  // False for files outside the project's source directories (tests,
  // examples), which rules usually analyse without reporting on.
  bool is_in_source_directories = true;
};

// Hooks of one rule at module granularity. Every list runs in registration
// order, the exit lists included.
template <typename ModuleContext> struct ModuleVisitors {
  template <typename Node>
  using Hook = std::function<Diagnostics(const Node &, ModuleContext &)>;
  using FinalHook = std::function<Diagnostics(const ModuleContext &)>;

  std::vector<Hook<ModuleHeader>> module_definition;
  std::vector<Hook<std::vector<Comment>>> comments;
  std::vector<Hook<Import>> imports;
  std::vector<Hook<std::vector<Declaration>>> declaration_list;
  std::vector<Hook<Declaration>> declaration_enter;
  std::vector<Hook<Declaration>> declaration_exit;
  std::vector<Hook<Expression>> expression_enter;
  std::vector<Hook<Expression>> expression_exit;
  std::vector<FinalHook> final_evaluation;

  bool HasExpressionHooks() const {
    return !expression_enter.empty() || !expression_exit.empty();
  }
};

template <typename ProjectContext> struct ProjectVisitors {
  template <typename Artifact>
  using Hook = std::function<Diagnostics(const Artifact &, ProjectContext &)>;
  using FinalHook = std::function<Diagnostics(const ProjectContext &)>;

  std::vector<Hook<std::optional<Manifest>>> manifest;
  std::vector<Hook<std::optional<Readme>>> readme;
  std::vector<Hook<DependencySet>> direct_dependencies;
  std::vector<Hook<DependencySet>> dependencies;
  std::vector<FinalHook> final_evaluation;
};

// `fold(accumulated, contribution)` must give the same observable result
// whatever order contributions are folded in.
template <typename ProjectContext, typename ModuleContext> struct ContextBridge {
  std::function<ModuleContext(const ModuleKey &, const ModuleName &,
                              const ProjectContext &)>
      to_module_context;
  std::function<ProjectContext(const ModuleKey &, const ModuleName &,
                               const ModuleContext &)>
      to_project_context;
  std::function<ProjectContext(const ProjectContext &, const ProjectContext &)>
      fold;
};

template <typename ProjectContext, typename ModuleContext> struct CompiledRule {
  std::string name;
  ProjectContext initial_context;
  TraversalMode mode = TraversalMode::kUnordered;
  ProjectVisitors<ProjectContext> project;
  // Absent for rules that only look at project-level artifacts.
  std::optional<ModuleVisitors<ModuleContext>> module;
  std::optional<ContextBridge<ProjectContext, ModuleContext>> bridge;
  // Identity of a project context, used to key the incremental cache.
  std::function<Fingerprint(const ProjectContext &)> context_fingerprint;
};

} // namespace modlint

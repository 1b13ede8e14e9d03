#pragma once

#include <modlint/analysis_cache.h>
#include <modlint/dependency_graph.h>
#include <modlint/project.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace modlint {

struct ModulesFailedToParse {
  std::vector<std::filesystem::path> paths;
};

struct NoModules {};

struct DuplicateModuleNames {
  ModuleName name;
  std::vector<std::filesystem::path> paths;
};

// `modules[i]` imports `modules[i + 1]`; the last one imports the first.
struct ImportCycle {
  std::vector<ModuleName> modules;
  std::vector<std::filesystem::path> paths;
};

using InvalidProjectError = std::variant<ModulesFailedToParse, NoModules,
                                         DuplicateModuleNames, ImportCycle>;

std::string DescribeError(const InvalidProjectError &error);

using ModulePtr = std::shared_ptr<const Module>;

// Forward cursor over modules in import order (imported before importer).
class ModuleCursor {
public:
  explicit ModuleCursor(std::shared_ptr<const std::vector<ModulePtr>> order);

  bool AtEnd() const { return position_ >= order_->size(); }
  const Module &Current() const;
  void Advance();
  void Reset() { position_ = 0; }
  std::size_t Position() const { return position_; }
  std::size_t Size() const { return order_->size(); }

private:
  std::shared_ptr<const std::vector<ModulePtr>> order_;
  std::size_t position_ = 0;
};

class ValidProject;
using ValidationResult = std::variant<ValidProject, InvalidProjectError>;

// Project snapshot guaranteed to have at least one module, only parsed
// modules, unique module names and an acyclic import graph. Copies share
// their state; every update returns a new snapshot.
class ValidProject {
public:
  const std::vector<ModulePtr> &Modules() const;
  const Module *FindModuleByPath(const std::filesystem::path &path) const;
  const Module *FindModuleByName(const ModuleName &name) const;
  // Module behind a node of Graph().
  const Module &ModuleAt(DependencyGraph::NodeId node) const;
  // Modules of the project imported by `module`, in import order.
  std::vector<const Module *> DirectImportsOf(const Module &module) const;

  const std::optional<Manifest> &ProjectManifest() const;
  const std::optional<Readme> &ProjectReadme() const;
  const DependencySet &Dependencies() const;
  DependencySet DirectDependencies() const;

  const DependencyGraph &Graph() const;
  const std::vector<ModulePtr> &SortedModules() const;
  ModuleCursor Cursor() const;
  // Set after a patch changed the imports of a module. Graph() and
  // SortedModules() then describe the previous imports until Revalidate().
  bool NeedsRevalidation() const;

  const AnalysisCache &Cache() const;
  ValidProject WithCache(AnalysisCache cache) const;

  // Replaces the module at `path`. Rejected when `path` is not part of the
  // project or when the new syntax tree declares another module name.
  std::optional<ValidProject> PatchModule(const std::filesystem::path &path,
                                          std::string source,
                                          SyntaxFile ast) const;

  // Validates the current module table again, keeping the cache.
  ValidationResult Revalidate() const;

private:
  struct State;
  explicit ValidProject(std::shared_ptr<const State> state);

  friend ValidationResult ValidateProject(std::vector<Module> modules,
                                          std::optional<Manifest> manifest,
                                          std::optional<Readme> readme,
                                          DependencySet dependencies);

  std::shared_ptr<const State> state_;
};

ValidationResult ValidateProject(std::vector<Module> modules,
                                 std::optional<Manifest> manifest,
                                 std::optional<Readme> readme,
                                 DependencySet dependencies);

} // namespace modlint

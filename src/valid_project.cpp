#include <modlint/valid_project.h>

#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace modlint {

struct ValidProject::State {
  std::vector<ModulePtr> modules;
  std::unordered_map<std::string, std::size_t> index_by_path;
  std::optional<Manifest> manifest;
  std::optional<Readme> readme;
  DependencySet dependencies;
  DependencyGraph graph;
  std::shared_ptr<const std::vector<ModulePtr>> sorted;
  std::vector<DependencyGraph::NodeId> order;
  bool needs_revalidation = false;
  AnalysisCache cache;
};

namespace {

std::string PathKey(const std::filesystem::path &path) {
  return path.lexically_normal().generic_string();
}

std::shared_ptr<const std::vector<ModulePtr>>
MaterializeOrder(const std::vector<ModulePtr> &modules,
                 const std::vector<DependencyGraph::NodeId> &order) {
  auto sorted = std::make_shared<std::vector<ModulePtr>>();
  sorted->reserve(order.size());
  for (const auto node : order) {
    sorted->push_back(modules.at(node));
  }
  return sorted;
}

std::set<ModuleName> ImportSet(const Module &module) {
  const auto names = module.ImportedModuleNames();
  return std::set<ModuleName>(names.begin(), names.end());
}

std::optional<DuplicateModuleNames>
FindDuplicateNames(const std::vector<ModulePtr> &modules) {
  std::map<ModuleName, std::vector<std::filesystem::path>> paths_by_name;
  std::vector<ModuleName> first_seen;
  for (const auto &module : modules) {
    auto &paths = paths_by_name[module->Name()];
    if (paths.empty()) {
      first_seen.push_back(module->Name());
    }
    paths.push_back(module->path);
  }
  for (const auto &name : first_seen) {
    const auto &paths = paths_by_name[name];
    if (paths.size() > 1) {
      return DuplicateModuleNames{name, paths};
    }
  }
  return std::nullopt;
}

std::string DescribePaths(const std::vector<std::filesystem::path> &paths) {
  std::ostringstream stream;
  for (const auto &path : paths) {
    stream << "\n  - " << path.generic_string();
  }
  return stream.str();
}

} // namespace

std::string DescribeError(const InvalidProjectError &error) {
  return std::visit(
      [](const auto &value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, ModulesFailedToParse>) {
          return "Some modules could not be parsed:" +
                 DescribePaths(value.paths);
        } else if constexpr (std::is_same_v<T, NoModules>) {
          return "The project does not contain any module to analyze.";
        } else if constexpr (std::is_same_v<T, DuplicateModuleNames>) {
          return "Found several modules named " + JoinModuleName(value.name) +
                 ":" + DescribePaths(value.paths);
        } else {
          std::string chain;
          for (const auto &name : value.modules) {
            chain += JoinModuleName(name) + " -> ";
          }
          if (!value.modules.empty()) {
            chain += JoinModuleName(value.modules.front());
          }
          return "Your module imports form a cycle: " + chain;
        }
      },
      error);
}

ModuleCursor::ModuleCursor(std::shared_ptr<const std::vector<ModulePtr>> order)
    : order_(std::move(order)) {}

const Module &ModuleCursor::Current() const {
  if (AtEnd()) {
    throw std::out_of_range("Module cursor is past the last module");
  }
  return *(*order_)[position_];
}

void ModuleCursor::Advance() {
  if (!AtEnd()) {
    ++position_;
  }
}

ValidProject::ValidProject(std::shared_ptr<const State> state)
    : state_(std::move(state)) {}

const std::vector<ModulePtr> &ValidProject::Modules() const {
  return state_->modules;
}

const Module *
ValidProject::FindModuleByPath(const std::filesystem::path &path) const {
  const auto found = state_->index_by_path.find(PathKey(path));
  if (found == state_->index_by_path.end()) {
    return nullptr;
  }
  return state_->modules[found->second].get();
}

const Module *ValidProject::FindModuleByName(const ModuleName &name) const {
  for (const auto &module : state_->modules) {
    if (module->Name() == name) {
      return module.get();
    }
  }
  return nullptr;
}

const Module &ValidProject::ModuleAt(DependencyGraph::NodeId node) const {
  return *state_->modules.at(node);
}

std::vector<const Module *>
ValidProject::DirectImportsOf(const Module &module) const {
  std::vector<const Module *> imports;
  const auto node = state_->graph.Find(module.Name());
  if (!node) {
    return imports;
  }
  for (const auto imported : state_->graph.ImportsOf(*node)) {
    imports.push_back(state_->modules[imported].get());
  }
  return imports;
}

const std::optional<Manifest> &ValidProject::ProjectManifest() const {
  return state_->manifest;
}

const std::optional<Readme> &ValidProject::ProjectReadme() const {
  return state_->readme;
}

const DependencySet &ValidProject::Dependencies() const {
  return state_->dependencies;
}

DependencySet ValidProject::DirectDependencies() const {
  return FilterDirectDependencies(state_->dependencies, state_->manifest);
}

const DependencyGraph &ValidProject::Graph() const { return state_->graph; }

const std::vector<ModulePtr> &ValidProject::SortedModules() const {
  return *state_->sorted;
}

ModuleCursor ValidProject::Cursor() const { return ModuleCursor(state_->sorted); }

bool ValidProject::NeedsRevalidation() const {
  return state_->needs_revalidation;
}

const AnalysisCache &ValidProject::Cache() const { return state_->cache; }

ValidProject ValidProject::WithCache(AnalysisCache cache) const {
  auto next = std::make_shared<State>(*state_);
  next->cache = std::move(cache);
  return ValidProject(std::move(next));
}

std::optional<ValidProject>
ValidProject::PatchModule(const std::filesystem::path &path, std::string source,
                          SyntaxFile ast) const {
  const auto found = state_->index_by_path.find(PathKey(path));
  if (found == state_->index_by_path.end()) {
    return std::nullopt;
  }
  const auto &previous = *state_->modules[found->second];
  if (ast.header.name != previous.Name()) {
    return std::nullopt;
  }

  auto replacement = std::make_shared<Module>();
  replacement->path = previous.path;
  replacement->source = std::move(source);
  replacement->ast = std::move(ast);
  replacement->is_in_source_directories = previous.is_in_source_directories;

  auto next = std::make_shared<State>(*state_);
  if (ImportSet(*replacement) != ImportSet(previous)) {
    next->needs_revalidation = true;
  }
  next->modules[found->second] = std::move(replacement);
  next->sorted = MaterializeOrder(next->modules, next->order);
  return ValidProject(std::move(next));
}

ValidationResult ValidProject::Revalidate() const {
  std::vector<Module> modules;
  modules.reserve(state_->modules.size());
  for (const auto &module : state_->modules) {
    modules.push_back(*module);
  }
  auto result = ValidateProject(std::move(modules), state_->manifest,
                                state_->readme, state_->dependencies);
  if (auto *project = std::get_if<ValidProject>(&result)) {
    return project->WithCache(state_->cache);
  }
  return result;
}

ValidationResult ValidateProject(std::vector<Module> modules,
                                 std::optional<Manifest> manifest,
                                 std::optional<Readme> readme,
                                 DependencySet dependencies) {
  ModulesFailedToParse parse_failures;
  for (const auto &module : modules) {
    if (!module.IsParsed()) {
      parse_failures.paths.push_back(module.path);
    }
  }
  if (!parse_failures.paths.empty()) {
    return parse_failures;
  }
  if (modules.empty()) {
    return NoModules{};
  }

  auto state = std::make_shared<ValidProject::State>();
  state->modules.reserve(modules.size());
  for (auto &module : modules) {
    state->modules.push_back(std::make_shared<const Module>(std::move(module)));
  }

  if (auto duplicates = FindDuplicateNames(state->modules)) {
    return *std::move(duplicates);
  }

  state->graph = BuildDependencyGraph(state->modules);
  auto sort = SortTopologically(state->graph);
  if (sort.HasCycle()) {
    ImportCycle cycle;
    for (const auto node : sort.cycle) {
      cycle.modules.push_back(state->graph.NameOf(node));
      cycle.paths.push_back(state->modules[node]->path);
    }
    return cycle;
  }

  for (std::size_t i = 0; i < state->modules.size(); ++i) {
    state->index_by_path.emplace(PathKey(state->modules[i]->path), i);
  }
  state->order = std::move(sort.order);
  state->sorted = MaterializeOrder(state->modules, state->order);
  state->manifest = std::move(manifest);
  state->readme = std::move(readme);
  state->dependencies = std::move(dependencies);
  return ValidProject(std::move(state));
}

} // namespace modlint

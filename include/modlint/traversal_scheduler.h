#pragma once

#include <modlint/compiled_visitors.h>
#include <modlint/rule.h>
#include <modlint/valid_project.h>

#include <algorithm>
#include <any>
#include <chrono>
#include <future>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace modlint {

enum class TraversalState {
  kNotStarted,
  kVisitingModule,
  kFolding,
  kFinalEvaluation,
  kDone
};

const char *TraversalStateName(TraversalState state);

// Identity of everything the project-level hooks observe: manifest, readme
// and dependency tables.
Fingerprint FingerprintProjectInputs(const ValidProject &project);

// Source text plus the file's source-directory membership, both of which a
// module visit observes.
Fingerprint FingerprintModule(const Module &module);

// Attaches errors raised while visiting `module` to that module.
void AttributeToModule(Diagnostics &diagnostics, const Module &module);

bool ShouldVisit(const RunOptions &options, const std::string &rule_name,
                 const Module &module);

// Runs the module hooks over one syntax tree in the fixed order: module
// definition, comments, imports, declaration list, then per declaration
// enter, expressions (pre-order enter, post-order exit) and exit, and
// finally the module evaluation.
template <typename ModuleContext> class ModuleVisit {
public:
  ModuleVisit(const ModuleVisitors<ModuleContext> &visitors,
              ModuleContext &context)
      : visitors_(visitors), context_(context) {}

  Diagnostics Run(const SyntaxFile &ast) {
    Fire(visitors_.module_definition, ast.header);
    Fire(visitors_.comments, ast.comments);
    for (const auto &import : ast.imports) {
      Fire(visitors_.imports, import);
    }
    Fire(visitors_.declaration_list, ast.declarations);
    for (const auto &declaration : ast.declarations) {
      Fire(visitors_.declaration_enter, declaration);
      if (declaration.body && visitors_.HasExpressionHooks()) {
        VisitExpression(*declaration.body);
      }
      Fire(visitors_.declaration_exit, declaration);
    }
    for (const auto &hook : visitors_.final_evaluation) {
      Append(hook(context_));
    }
    return std::move(diagnostics_);
  }

private:
  template <typename Hooks, typename Node>
  void Fire(const Hooks &hooks, const Node &node) {
    for (const auto &hook : hooks) {
      Append(hook(node, context_));
    }
  }

  void VisitExpression(const Expression &expression) {
    Fire(visitors_.expression_enter, expression);
    for (const auto &child : expression.children) {
      VisitExpression(child);
    }
    Fire(visitors_.expression_exit, expression);
  }

  void Append(Diagnostics more) {
    diagnostics_.insert(diagnostics_.end(),
                        std::make_move_iterator(more.begin()),
                        std::make_move_iterator(more.end()));
  }

  const ModuleVisitors<ModuleContext> &visitors_;
  ModuleContext &context_;
  Diagnostics diagnostics_;
};

template <typename ProjectContext, typename ModuleContext>
class TraversalScheduler {
public:
  TraversalScheduler(const CompiledRule<ProjectContext, ModuleContext> &rule,
                     RunOptions options)
      : rule_(rule), options_(std::move(options)),
        logger_(EnsureLogger(options_.logger)) {}

  RuleRunResult Run(const ValidProject &project) {
    if (project.NeedsRevalidation()) {
      throw std::logic_error("Rule " + rule_.name +
                             " cannot run on a project whose imports changed "
                             "since validation; revalidate it first");
    }
    const auto start = std::chrono::steady_clock::now();
    state_ = TraversalState::kNotStarted;
    logger_->Log(LogLevel::kDebug, "rule.start",
                 {{"rule", rule_.name},
                  {"mode", TraversalModeName(rule_.mode)},
                  {"modules", std::to_string(project.Modules().size())}});

    RuleRunResult result;
    if (options_.use_cache) {
      result.cache = project.Cache().ForRule(rule_.name);
    }

    ProjectContext seed = rule_.initial_context;
    VisitProjectArtifacts(project, seed, result.diagnostics);
    project_fingerprint_ = FingerprintProjectInputs(project);

    std::vector<ProjectContext> contributions;
    if (rule_.module && rule_.bridge) {
      if (rule_.mode == TraversalMode::kImportOrdered) {
        VisitInImportOrder(project, seed, result, contributions);
      } else {
        VisitUnordered(project, seed, result, contributions);
      }
    }

    state_ = TraversalState::kFolding;
    ProjectContext folded = seed;
    for (const auto &contribution : contributions) {
      folded = rule_.bridge->fold(folded, contribution);
    }

    state_ = TraversalState::kFinalEvaluation;
    for (const auto &hook : rule_.project.final_evaluation) {
      AppendGeneral(hook(folded), result.diagnostics);
    }
    final_context_ = std::move(folded);

    std::set<ModuleName> present;
    for (const auto &module : project.Modules()) {
      present.insert(module->Name());
    }
    result.cache.RetainOnly(present);
    if (!options_.use_cache) {
      result.cache = RuleCache{};
    }

    for (auto &diagnostic : result.diagnostics) {
      diagnostic.rule_name = rule_.name;
    }
    SortDiagnostics(result.diagnostics);
    state_ = TraversalState::kDone;

    const auto duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count();
    logger_->Log(
        LogLevel::kInfo, "rule.complete",
        {{"rule", rule_.name},
         {"diagnostics", std::to_string(result.diagnostics.size())},
         {"reused", std::to_string(result.cache_statistics.reused.size())},
         {"recomputed",
          std::to_string(result.cache_statistics.recomputed.size())},
         {"duration_ms", std::to_string(duration_ms)}});
    return result;
  }

  TraversalState State() const { return state_; }
  std::size_t CursorPosition() const { return position_; }
  // Folded project context of the last completed run.
  const std::optional<ProjectContext> &FinalContext() const {
    return final_context_;
  }

private:
  struct ModuleOutcome {
    ProjectContext contribution;
    Diagnostics diagnostics;
  };

  void VisitProjectArtifacts(const ValidProject &project, ProjectContext &seed,
                             Diagnostics &diagnostics) {
    for (const auto &hook : rule_.project.manifest) {
      AppendGeneral(hook(project.ProjectManifest(), seed), diagnostics);
    }
    for (const auto &hook : rule_.project.readme) {
      AppendGeneral(hook(project.ProjectReadme(), seed), diagnostics);
    }
    if (!rule_.project.direct_dependencies.empty()) {
      const auto direct = project.DirectDependencies();
      for (const auto &hook : rule_.project.direct_dependencies) {
        AppendGeneral(hook(direct, seed), diagnostics);
      }
    }
    for (const auto &hook : rule_.project.dependencies) {
      AppendGeneral(hook(project.Dependencies(), seed), diagnostics);
    }
  }

  ModuleOutcome VisitModule(const Module &module,
                            const ProjectContext &input) const {
    const ModuleKey key{module.path, module.is_in_source_directories};
    auto context = rule_.bridge->to_module_context(key, module.Name(), input);
    auto diagnostics =
        ModuleVisit<ModuleContext>(*rule_.module, context).Run(*module.ast);
    AttributeToModule(diagnostics, module);
    return ModuleOutcome{
        rule_.bridge->to_project_context(key, module.Name(), context),
        std::move(diagnostics)};
  }

  // Reuses a cached outcome when the fingerprints still match.
  std::optional<ModuleOutcome> Reuse(const Module &module,
                                     Fingerprint context_fingerprint,
                                     RuleRunResult &result) {
    if (!options_.use_cache) {
      return std::nullopt;
    }
    const auto *entry = result.cache.Lookup(
        module.Name(), FingerprintModule(module), context_fingerprint);
    if (entry == nullptr) {
      logger_->Log(LogLevel::kDebug, "module.cache.miss",
                   {{"rule", rule_.name},
                    {"module", JoinModuleName(module.Name())}});
      return std::nullopt;
    }
    const auto *contribution =
        std::any_cast<ProjectContext>(&entry->contribution);
    if (contribution == nullptr) {
      result.cache.Invalidate(module.Name());
      return std::nullopt;
    }
    logger_->Log(LogLevel::kDebug, "module.cache.hit",
                 {{"rule", rule_.name},
                  {"module", JoinModuleName(module.Name())}});
    result.cache_statistics.reused.push_back(module.Name());
    return ModuleOutcome{*contribution, entry->diagnostics};
  }

  void Remember(const Module &module, Fingerprint context_fingerprint,
                const ModuleOutcome &outcome, RuleRunResult &result) {
    result.cache_statistics.recomputed.push_back(module.Name());
    if (!options_.use_cache) {
      return;
    }
    result.cache.Store(module.Name(),
                       ModuleCacheEntry{FingerprintModule(module),
                                        context_fingerprint,
                                        std::any(outcome.contribution),
                                        outcome.diagnostics});
  }

  void VisitUnordered(const ValidProject &project, const ProjectContext &seed,
                      RuleRunResult &result,
                      std::vector<ProjectContext> &contributions) {
    const auto context_fingerprint =
        rule_.context_fingerprint
            ? CombineFingerprints(project_fingerprint_,
                                  rule_.context_fingerprint(seed))
            : project_fingerprint_;

    std::vector<const Module *> visited;
    std::vector<std::optional<ModuleOutcome>> outcomes;
    std::vector<std::size_t> pending;
    for (const auto &module : project.Modules()) {
      if (!ShouldVisit(options_, rule_.name, *module)) {
        continue;
      }
      visited.push_back(module.get());
      outcomes.push_back(Reuse(*module, context_fingerprint, result));
      if (!outcomes.back()) {
        pending.push_back(visited.size() - 1);
      }
    }

    state_ = TraversalState::kVisitingModule;
    if (options_.worker_count > 1 && pending.size() > 1) {
      VisitInParallel(visited, pending, seed, outcomes);
    } else {
      for (const auto index : pending) {
        position_ = index;
        outcomes[index] = VisitModule(*visited[index], seed);
      }
    }
    for (const auto index : pending) {
      Remember(*visited[index], context_fingerprint, *outcomes[index], result);
    }

    for (auto &outcome : outcomes) {
      AppendAll(std::move(outcome->diagnostics), result.diagnostics);
      contributions.push_back(std::move(outcome->contribution));
    }
  }

  void VisitInParallel(const std::vector<const Module *> &visited,
                       const std::vector<std::size_t> &pending,
                       const ProjectContext &seed,
                       std::vector<std::optional<ModuleOutcome>> &outcomes) {
    const auto workers = std::min(options_.worker_count, pending.size());
    std::vector<std::future<void>> tasks;
    tasks.reserve(workers);
    for (std::size_t worker = 0; worker < workers; ++worker) {
      tasks.push_back(std::async(std::launch::async, [&, worker]() {
        for (std::size_t i = worker; i < pending.size(); i += workers) {
          const auto index = pending[i];
          outcomes[index] = VisitModule(*visited[index], seed);
        }
      }));
    }
    for (auto &task : tasks) {
      task.get();
    }
    position_ = visited.size();
  }

  void VisitInImportOrder(const ValidProject &project,
                          const ProjectContext &seed, RuleRunResult &result,
                          std::vector<ProjectContext> &contributions) {
    std::map<const Module *, ProjectContext> contribution_of;
    std::map<const Module *, Fingerprint> upstream_sources;

    auto cursor = project.Cursor();
    for (; !cursor.AtEnd(); cursor.Advance()) {
      const auto &module = cursor.Current();
      position_ = cursor.Position();
      state_ = TraversalState::kVisitingModule;

      ProjectContext input = seed;
      auto upstream = project_fingerprint_;
      auto own_sources = FingerprintText(module.source);
      for (const auto *imported : project.DirectImportsOf(module)) {
        const auto contribution = contribution_of.find(imported);
        if (contribution != contribution_of.end()) {
          input = rule_.bridge->fold(input, contribution->second);
        }
        const auto sources = upstream_sources.find(imported);
        if (sources != upstream_sources.end()) {
          upstream = CombineFingerprints(upstream, sources->second);
          own_sources = CombineFingerprints(own_sources, sources->second);
        }
      }
      upstream_sources[&module] = own_sources;

      if (!ShouldVisit(options_, rule_.name, module)) {
        continue;
      }

      const auto context_fingerprint =
          rule_.context_fingerprint
              ? CombineFingerprints(project_fingerprint_,
                                    rule_.context_fingerprint(input))
              : upstream;
      auto outcome = Reuse(module, context_fingerprint, result);
      if (!outcome) {
        outcome = VisitModule(module, input);
        Remember(module, context_fingerprint, *outcome, result);
      }

      AppendAll(std::move(outcome->diagnostics), result.diagnostics);
      contribution_of.emplace(&module, outcome->contribution);
      contributions.push_back(std::move(outcome->contribution));
    }
  }

  static void AppendAll(Diagnostics more, Diagnostics &target) {
    target.insert(target.end(), std::make_move_iterator(more.begin()),
                  std::make_move_iterator(more.end()));
  }

  static void AppendGeneral(Diagnostics more, Diagnostics &target) {
    for (auto &diagnostic : more) {
      target.push_back(ToGeneralError(std::move(diagnostic)));
    }
  }

  const CompiledRule<ProjectContext, ModuleContext> &rule_;
  RunOptions options_;
  std::shared_ptr<Logger> logger_;
  TraversalState state_ = TraversalState::kNotStarted;
  std::size_t position_ = 0;
  Fingerprint project_fingerprint_ = 0;
  std::optional<ProjectContext> final_context_;
};

} // namespace modlint

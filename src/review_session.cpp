#include <modlint/review_session.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace modlint {
namespace {

std::string ErrorKind(const InvalidProjectError &error) {
  switch (error.index()) {
  case 0:
    return "modules-failed-to-parse";
  case 1:
    return "no-modules";
  case 2:
    return "duplicate-module-names";
  default:
    return "import-cycle";
  }
}

std::string PathKey(const std::filesystem::path &path) {
  return path.lexically_normal().generic_string();
}

} // namespace

ReviewSession::ReviewSession(std::vector<std::unique_ptr<Rule>> rules,
                             RunOptions options)
    : rules_(std::move(rules)), options_(std::move(options)),
      logger_(EnsureLogger(options_.logger)) {
  options_.logger = logger_;
  for (const auto &rule : rules_) {
    if (!rule) {
      throw std::invalid_argument("Review session rules cannot be null");
    }
  }
}

std::optional<InvalidProjectError> ReviewSession::Load(ProjectInputs inputs) {
  inputs_ = std::move(inputs);
  AnalysisCache cache;
  if (project_) {
    cache = project_->Cache();
  }
  return Validate(std::move(cache));
}

std::optional<InvalidProjectError>
ReviewSession::ApplyModuleEdit(const std::filesystem::path &path,
                               std::string source,
                               std::optional<SyntaxFile> ast) {
  const auto key = PathKey(path);
  auto existing = std::find_if(
      inputs_.modules.begin(), inputs_.modules.end(),
      [&](const Module &module) { return PathKey(module.path) == key; });

  if (project_ && ast && existing != inputs_.modules.end()) {
    if (auto patched = project_->PatchModule(path, source, *ast)) {
      existing->source = std::move(source);
      existing->ast = std::move(ast);
      if (!patched->NeedsRevalidation()) {
        logger_->Log(LogLevel::kDebug, "project.patch.accepted",
                     {{"path", key}});
        project_ = std::move(*patched);
        return std::nullopt;
      }
      logger_->Log(LogLevel::kDebug, "project.patch.imports_changed",
                   {{"path", key}});
      auto cache = patched->Cache();
      return Validate(std::move(cache));
    }
    logger_->Log(LogLevel::kDebug, "project.patch.rejected", {{"path", key}});
  }

  if (existing != inputs_.modules.end()) {
    existing->source = std::move(source);
    existing->ast = std::move(ast);
  } else {
    Module module;
    module.path = path;
    module.source = std::move(source);
    module.ast = std::move(ast);
    if (inputs_.manifest) {
      module.is_in_source_directories = IsUnderSourceDirectories(
          path, inputs_.manifest->source_directories);
    }
    inputs_.modules.push_back(std::move(module));
  }
  AnalysisCache cache;
  if (project_) {
    cache = project_->Cache();
  }
  return Validate(std::move(cache));
}

std::optional<InvalidProjectError>
ReviewSession::Validate(AnalysisCache cache) {
  auto result = ValidateProject(inputs_.modules, inputs_.manifest,
                                inputs_.readme, inputs_.dependencies);
  if (auto *error = std::get_if<InvalidProjectError>(&result)) {
    logger_->Log(LogLevel::kDebug, "project.validation",
                 {{"outcome", ErrorKind(*error)}});
    project_.reset();
    project_error_ = *error;
    return project_error_;
  }
  auto &project = std::get<ValidProject>(result);
  logger_->Log(LogLevel::kDebug, "project.validation",
               {{"outcome", "valid"},
                {"modules", std::to_string(project.Modules().size())}});
  project_ = project.WithCache(std::move(cache));
  project_error_.reset();
  return std::nullopt;
}

ReviewOutcome ReviewSession::Run() {
  ReviewOutcome outcome;
  if (!project_) {
    outcome.project_error =
        project_error_ ? project_error_
                       : std::optional<InvalidProjectError>(NoModules{});
    return outcome;
  }

  const auto start = std::chrono::steady_clock::now();
  AnalysisCache cache;
  for (const auto &rule : rules_) {
    auto result = rule->Run(*project_, options_);
    outcome.diagnostics.insert(
        outcome.diagnostics.end(),
        std::make_move_iterator(result.diagnostics.begin()),
        std::make_move_iterator(result.diagnostics.end()));
    outcome.cache_statistics[rule->Name()] = std::move(result.cache_statistics);
    if (options_.use_cache) {
      cache.Put(rule->Name(), std::move(result.cache));
    }
  }
  project_ = project_->WithCache(std::move(cache));
  SortDiagnostics(outcome.diagnostics);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger_->Log(LogLevel::kInfo, "review.complete",
               {{"rules", std::to_string(rules_.size())},
                {"diagnostics", std::to_string(outcome.diagnostics.size())},
                {"duration_ms", std::to_string(duration_ms)}});
  return outcome;
}

void ReviewSession::ReplaceRules(std::vector<std::unique_ptr<Rule>> rules) {
  for (const auto &rule : rules) {
    if (!rule) {
      throw std::invalid_argument("Review session rules cannot be null");
    }
  }
  rules_ = std::move(rules);
  if (project_) {
    project_ = project_->WithCache(AnalysisCache{});
  }
}

void ReviewSession::SetOptions(RunOptions options) {
  const bool filter_changed = options.target_filter != options_.target_filter;
  options_ = std::move(options);
  logger_ = EnsureLogger(options_.logger);
  options_.logger = logger_;
  if (filter_changed && project_) {
    logger_->Log(LogLevel::kDebug, "session.cache.dropped",
                 {{"reason", "target-filter"}});
    project_ = project_->WithCache(AnalysisCache{});
  }
}

std::vector<std::string> ReviewSession::RuleNames() const {
  std::vector<std::string> names;
  names.reserve(rules_.size());
  for (const auto &rule : rules_) {
    names.push_back(rule->Name());
  }
  return names;
}

} // namespace modlint

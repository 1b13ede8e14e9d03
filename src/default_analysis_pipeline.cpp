#include <modlint/default_analysis_pipeline.h>

#include <chrono>
#include <utility>

namespace modlint {

DefaultAnalysisPipeline::DefaultAnalysisPipeline(PipelineComponents components)
    : loader_(std::move(components.loader)),
      rules_(std::move(components.rules)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))) {}

void DefaultAnalysisPipeline::ConfigureSession(const AnalysisConfig &config) {
  // The previous filter stays alive until the session has seen the new one.
  std::unique_ptr<PathPrefixTargetFilter> replacement;
  if (!filter_ || config.ignored_paths != filter_ignored_paths_ ||
      config.rule_ignored_paths != filter_rule_ignored_paths_) {
    replacement = std::make_unique<PathPrefixTargetFilter>(
        config.ignored_paths, config.rule_ignored_paths);
    filter_ignored_paths_ = config.ignored_paths;
    filter_rule_ignored_paths_ = config.rule_ignored_paths;
  }

  RunOptions options;
  options.worker_count = config.worker_count == 0 ? 1 : config.worker_count;
  options.use_cache = config.use_cache;
  options.target_filter = replacement ? replacement.get() : filter_.get();
  options.logger = logger_;
  if (session_) {
    session_->SetOptions(std::move(options));
  } else {
    session_ = std::make_unique<ReviewSession>(std::move(rules_), options);
  }
  if (replacement) {
    filter_ = std::move(replacement);
  }
}

PipelineResult DefaultAnalysisPipeline::Run(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"project", config.project_path},
                {"workers", std::to_string(config.worker_count)},
                {"cache", config.use_cache ? "on" : "off"}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  auto inputs = loader_->Load(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "load"},
                {"modules", std::to_string(inputs.modules.size())}});

  ConfigureSession(config);
  const auto invalid = session_->Load(std::move(inputs));
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "validate"}, {"valid", invalid ? "false" : "true"}});

  auto outcome = session_->Run();
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "review"},
                {"diagnostics", std::to_string(outcome.diagnostics.size())}});

  auto report = reporter_->Render(outcome, config);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"diagnostics", std::to_string(outcome.diagnostics.size())}});

  return PipelineResult{std::move(report), std::move(outcome)};
}

} // namespace modlint

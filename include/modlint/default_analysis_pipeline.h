#pragma once

#include <modlint/analysis_pipeline_builder.h>
#include <modlint/review_session.h>
#include <modlint/rule_target_filter.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace modlint {

// Loads the project snapshot, validates it, runs every rule through a
// review session and renders the outcome. The session, and with it the
// incremental cache, lives as long as the pipeline; each Run applies its own
// worker, cache and ignored-path settings to it.
class DefaultAnalysisPipeline : public AnalysisPipeline {
public:
  explicit DefaultAnalysisPipeline(PipelineComponents components);

  PipelineResult Run(const AnalysisConfig &config) override;

  const ReviewSession *Session() const { return session_.get(); }

private:
  void ConfigureSession(const AnalysisConfig &config);

  std::unique_ptr<ProjectLoader> loader_;
  std::vector<std::unique_ptr<Rule>> rules_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<PathPrefixTargetFilter> filter_;
  std::vector<std::string> filter_ignored_paths_;
  std::map<std::string, std::vector<std::string>> filter_rule_ignored_paths_;
  std::unique_ptr<ReviewSession> session_;
};

} // namespace modlint

#include <modlint/analysis_pipeline_builder.h>

#include <modlint/default_analysis_pipeline.h>
#include <modlint/text_reporter.h>
#include <modlint/yaml_project_loader.h>

#include <iterator>
#include <stdexcept>
#include <utility>

namespace modlint {

AnalysisPipelineBuilder::AnalysisPipelineBuilder(const RuleRegistry &registry)
    : registry_(&registry) {}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithLoader(std::unique_ptr<ProjectLoader> loader) {
  components_.loader = std::move(loader);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithRule(std::unique_ptr<Rule> rule) {
  if (!rule) {
    throw std::invalid_argument("Rule cannot be null");
  }
  components_.rules.push_back(std::move(rule));
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithRuleNames(std::vector<std::string> names) {
  rule_names_ = std::move(names);
  return *this;
}

DefaultAnalysisPipeline AnalysisPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  components_.loader = components_.loader
                           ? std::move(components_.loader)
                           : std::make_unique<YamlProjectLoader>(
                                 components_.logger);
  components_.reporter = components_.reporter
                             ? std::move(components_.reporter)
                             : std::make_unique<TextReporter>();
  if (components_.rules.empty() || !rule_names_.empty()) {
    auto selected = registry_->CreateRules(rule_names_);
    components_.rules.insert(components_.rules.end(),
                             std::make_move_iterator(selected.begin()),
                             std::make_move_iterator(selected.end()));
  }
  return DefaultAnalysisPipeline(std::move(components_));
}

} // namespace modlint

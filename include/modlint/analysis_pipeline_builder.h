#pragma once

#include <modlint/interfaces.h>
#include <modlint/logging.h>
#include <modlint/rule_registry.h>

#include <memory>
#include <string>
#include <vector>

namespace modlint {

class DefaultAnalysisPipeline;

struct PipelineComponents {
  std::unique_ptr<ProjectLoader> loader;
  std::vector<std::unique_ptr<Rule>> rules;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
};

class AnalysisPipelineBuilder {
public:
  explicit AnalysisPipelineBuilder(
      const RuleRegistry &registry = GlobalRuleRegistry());

  AnalysisPipelineBuilder &WithLoader(std::unique_ptr<ProjectLoader> loader);
  AnalysisPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalysisPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  // Rules added directly run before the rules selected by name.
  AnalysisPipelineBuilder &WithRule(std::unique_ptr<Rule> rule);
  // Empty selects the registry's default rules, unless rules were added
  // with WithRule.
  AnalysisPipelineBuilder &WithRuleNames(std::vector<std::string> names);

  DefaultAnalysisPipeline Build();

private:
  const RuleRegistry *registry_;
  std::vector<std::string> rule_names_;
  PipelineComponents components_;
};

} // namespace modlint

#pragma once

#include <modlint/models.h>

namespace modlint {

class ProjectLoader {
public:
  virtual ~ProjectLoader() = default;
  virtual ProjectInputs Load(const AnalysisConfig &config) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const ReviewOutcome &outcome,
                        const AnalysisConfig &config) = 0;
};

class AnalysisPipeline {
public:
  virtual ~AnalysisPipeline() = default;
  virtual PipelineResult Run(const AnalysisConfig &config) = 0;
};

} // namespace modlint

#pragma once

#include <modlint/logging.h>
#include <modlint/review_session.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace modlint {

struct AnalysisConfig {
  // Snapshot of the parsed project.
  std::string project_path;
  // "text" and/or "json"; empty renders text.
  std::vector<std::string> formats;
  bool use_cache = true;
  std::size_t worker_count = 1;
  // Overrides the source directories of the manifest.
  std::vector<std::string> source_directories;
  std::vector<std::string> ignored_paths;
  std::map<std::string, std::vector<std::string>> rule_ignored_paths;
  LoggingConfig logging;
  std::shared_ptr<Logger> logger;
};

struct Report {
  std::string text;
  std::string json;
};

struct PipelineResult {
  Report report;
  ReviewOutcome outcome;
};

} // namespace modlint

#pragma once

#include <modlint/analysis_cache.h>
#include <modlint/diagnostic.h>
#include <modlint/logging.h>
#include <modlint/valid_project.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace modlint {

enum class TraversalMode { kUnordered, kImportOrdered };

const char *TraversalModeName(TraversalMode mode);

// Decides, before traversal, whether a rule visits the module at a path.
class RuleTargetFilter {
public:
  virtual ~RuleTargetFilter() = default;
  virtual bool Includes(const std::string &rule_name,
                        const std::filesystem::path &path) const = 0;
};

struct RunOptions {
  // Worker tasks used for the module visits of unordered rules.
  std::size_t worker_count = 1;
  bool use_cache = true;
  const RuleTargetFilter *target_filter = nullptr;
  std::shared_ptr<Logger> logger;
};

struct CacheStatistics {
  std::vector<ModuleName> reused;
  std::vector<ModuleName> recomputed;
};

struct RuleRunResult {
  Diagnostics diagnostics;
  RuleCache cache;
  CacheStatistics cache_statistics;
};

// Runnable, immutable rule produced by a finalized schema.
class Rule {
public:
  virtual ~Rule() = default;
  virtual const std::string &Name() const = 0;
  virtual TraversalMode Mode() const = 0;
  // Requires !project.NeedsRevalidation().
  virtual RuleRunResult Run(const ValidProject &project,
                            const RunOptions &options) const = 0;
};

} // namespace modlint

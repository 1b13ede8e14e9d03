#pragma once

#include <modlint/compiled_visitors.h>
#include <modlint/rule.h>
#include <modlint/traversal_scheduler.h>

#include <string>
#include <utility>

namespace modlint {

template <typename ProjectContext, typename ModuleContext>
class ProjectRule final : public Rule {
public:
  explicit ProjectRule(CompiledRule<ProjectContext, ModuleContext> compiled)
      : compiled_(std::move(compiled)) {}

  const std::string &Name() const override { return compiled_.name; }
  TraversalMode Mode() const override { return compiled_.mode; }

  RuleRunResult Run(const ValidProject &project,
                    const RunOptions &options) const override {
    TraversalScheduler<ProjectContext, ModuleContext> scheduler(compiled_,
                                                                options);
    return scheduler.Run(project);
  }

  const CompiledRule<ProjectContext, ModuleContext> &Compiled() const {
    return compiled_;
  }

private:
  CompiledRule<ProjectContext, ModuleContext> compiled_;
};

} // namespace modlint

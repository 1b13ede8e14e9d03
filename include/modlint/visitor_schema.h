#pragma once

#include <modlint/compiled_visitors.h>
#include <modlint/project_rule.h>
#include <modlint/rule.h>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace modlint {

// Raised when a schema cannot become a runnable rule.
class SchemaConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

template <typename ModuleContext, typename Self>
class BasicModuleVisitorBuilder {
public:
  template <typename Node>
  using Visitor = std::function<Diagnostics(const Node &, ModuleContext &)>;
  template <typename Node>
  using DirectedVisitor =
      std::function<Diagnostics(const Node &, Direction, ModuleContext &)>;
  using FinalEvaluation = std::function<Diagnostics(const ModuleContext &)>;

  Self &WithModuleDefinitionVisitor(Visitor<ModuleHeader> visitor) {
    return Add(visitors_.module_definition, std::move(visitor));
  }

  Self &WithCommentsVisitor(Visitor<std::vector<Comment>> visitor) {
    return Add(visitors_.comments, std::move(visitor));
  }

  // Called once per import, in source order.
  Self &WithImportVisitor(Visitor<Import> visitor) {
    return Add(visitors_.imports, std::move(visitor));
  }

  Self &
  WithDeclarationListVisitor(Visitor<std::vector<Declaration>> visitor) {
    return Add(visitors_.declaration_list, std::move(visitor));
  }

  Self &WithDeclarationVisitor(DirectedVisitor<Declaration> visitor) {
    return AddDirected(visitors_.declaration_enter, visitors_.declaration_exit,
                       std::move(visitor));
  }

  Self &WithDeclarationEnterVisitor(Visitor<Declaration> visitor) {
    return Add(visitors_.declaration_enter, std::move(visitor));
  }

  Self &WithDeclarationExitVisitor(Visitor<Declaration> visitor) {
    return Add(visitors_.declaration_exit, std::move(visitor));
  }

  Self &WithExpressionVisitor(DirectedVisitor<Expression> visitor) {
    return AddDirected(visitors_.expression_enter, visitors_.expression_exit,
                       std::move(visitor));
  }

  Self &WithExpressionEnterVisitor(Visitor<Expression> visitor) {
    return Add(visitors_.expression_enter, std::move(visitor));
  }

  Self &WithExpressionExitVisitor(Visitor<Expression> visitor) {
    return Add(visitors_.expression_exit, std::move(visitor));
  }

  Self &WithFinalModuleEvaluation(FinalEvaluation evaluation) {
    return Add(visitors_.final_evaluation, std::move(evaluation));
  }

  bool HasAnyVisitor() const { return has_visitor_; }
  const ModuleVisitors<ModuleContext> &Visitors() const { return visitors_; }

protected:
  BasicModuleVisitorBuilder() = default;

private:
  template <typename List, typename Hook> Self &Add(List &list, Hook hook) {
    if (!hook) {
      throw SchemaConfigurationError("Visitor cannot be null");
    }
    list.push_back(std::move(hook));
    has_visitor_ = true;
    return static_cast<Self &>(*this);
  }

  template <typename Node>
  Self &AddDirected(std::vector<Visitor<Node>> &enter,
                    std::vector<Visitor<Node>> &exit,
                    DirectedVisitor<Node> visitor) {
    if (!visitor) {
      throw SchemaConfigurationError("Visitor cannot be null");
    }
    enter.push_back([visitor](const Node &node, ModuleContext &context) {
      return visitor(node, Direction::kEnter, context);
    });
    exit.push_back([visitor](const Node &node, ModuleContext &context) {
      return visitor(node, Direction::kExit, context);
    });
    has_visitor_ = true;
    return static_cast<Self &>(*this);
  }

  ModuleVisitors<ModuleContext> visitors_;
  bool has_visitor_ = false;
};

// Module hooks attached to a project rule.
template <typename ModuleContext>
class ModuleVisitorBuilder final
    : public BasicModuleVisitorBuilder<ModuleContext,
                                       ModuleVisitorBuilder<ModuleContext>> {};

// Rule that looks at each module in isolation. It runs as a project rule
// whose project and module contexts are the same value and whose fold keeps
// the last contribution.
template <typename Context>
class ModuleRuleSchema final
    : public BasicModuleVisitorBuilder<Context, ModuleRuleSchema<Context>> {
public:
  ModuleRuleSchema(std::string name, Context initial_context)
      : name_(std::move(name)), initial_context_(std::move(initial_context)) {}

  std::unique_ptr<Rule> ToRule() const {
    if (name_.empty()) {
      throw SchemaConfigurationError("Rule name cannot be empty");
    }
    if (!this->HasAnyVisitor()) {
      throw SchemaConfigurationError("Rule '" + name_ +
                                     "' does not register any visitor");
    }

    CompiledRule<Context, Context> compiled{name_, initial_context_};
    compiled.mode = TraversalMode::kUnordered;
    compiled.module = this->Visitors();
    ContextBridge<Context, Context> bridge;
    bridge.to_module_context = [](const ModuleKey &, const ModuleName &,
                                  const Context &project) { return project; };
    bridge.to_project_context = [](const ModuleKey &, const ModuleName &,
                                   const Context &module) { return module; };
    bridge.fold = [](const Context &, const Context &latest) {
      return latest;
    };
    compiled.bridge = std::move(bridge);
    return std::make_unique<ProjectRule<Context, Context>>(std::move(compiled));
  }

private:
  std::string name_;
  Context initial_context_;
};

template <typename ProjectContext, typename ModuleContext>
class ProjectRuleSchema {
public:
  template <typename Artifact>
  using Visitor = std::function<Diagnostics(const Artifact &, ProjectContext &)>;
  using FinalEvaluation = std::function<Diagnostics(const ProjectContext &)>;

  ProjectRuleSchema(std::string name, ProjectContext initial_context)
      : name_(std::move(name)), initial_context_(std::move(initial_context)) {}

  ProjectRuleSchema &
  WithManifestProjectVisitor(Visitor<std::optional<Manifest>> visitor) {
    return Add(project_.manifest, std::move(visitor));
  }

  ProjectRuleSchema &
  WithReadmeProjectVisitor(Visitor<std::optional<Readme>> visitor) {
    return Add(project_.readme, std::move(visitor));
  }

  ProjectRuleSchema &
  WithDirectDependenciesProjectVisitor(Visitor<DependencySet> visitor) {
    return Add(project_.direct_dependencies, std::move(visitor));
  }

  ProjectRuleSchema &
  WithDependenciesProjectVisitor(Visitor<DependencySet> visitor) {
    return Add(project_.dependencies, std::move(visitor));
  }

  ProjectRuleSchema &WithFinalProjectEvaluation(FinalEvaluation evaluation) {
    return Add(project_.final_evaluation, std::move(evaluation));
  }

  // May be called several times; hooks accumulate in registration order.
  ProjectRuleSchema &WithModuleVisitor(
      const std::function<void(ModuleVisitorBuilder<ModuleContext> &)>
          &configure) {
    if (!configure) {
      throw SchemaConfigurationError("Module visitor cannot be null");
    }
    configure(module_);
    return *this;
  }

  ProjectRuleSchema &
  WithModuleContext(ContextBridge<ProjectContext, ModuleContext> bridge) {
    if (!bridge.to_module_context || !bridge.to_project_context ||
        !bridge.fold) {
      throw SchemaConfigurationError(
          "Rule '" + name_ +
          "' needs to_module_context, to_project_context and fold");
    }
    bridge_ = std::move(bridge);
    return *this;
  }

  // Visits modules in import order; each module starts from the seed context
  // folded with the contributions of the modules it imports.
  ProjectRuleSchema &WithContextFromImportedModules() {
    mode_ = TraversalMode::kImportOrdered;
    return *this;
  }

  // Identity of the context a module receives, keying its cache entry. In
  // import-ordered mode a rule without one is keyed on the sources of every
  // transitive upstream module, so even a comment-only edit recomputes all
  // of its importers.
  ProjectRuleSchema &
  WithContextFingerprint(std::function<Fingerprint(const ProjectContext &)>
                             fingerprint) {
    context_fingerprint_ = std::move(fingerprint);
    return *this;
  }

  bool HasAnyVisitor() const {
    return has_project_visitor_ || module_.HasAnyVisitor();
  }

  std::unique_ptr<Rule> ToRule() const {
    if (name_.empty()) {
      throw SchemaConfigurationError("Rule name cannot be empty");
    }
    if (!HasAnyVisitor()) {
      throw SchemaConfigurationError("Rule '" + name_ +
                                     "' does not register any visitor");
    }
    if (module_.HasAnyVisitor() && !bridge_) {
      throw SchemaConfigurationError(
          "Rule '" + name_ +
          "' visits modules but does not define a module context");
    }

    CompiledRule<ProjectContext, ModuleContext> compiled{name_,
                                                         initial_context_};
    compiled.mode = mode_;
    compiled.project = project_;
    if (module_.HasAnyVisitor()) {
      compiled.module = module_.Visitors();
      compiled.bridge = bridge_;
    }
    compiled.context_fingerprint = context_fingerprint_;
    return std::make_unique<ProjectRule<ProjectContext, ModuleContext>>(
        std::move(compiled));
  }

private:
  template <typename List, typename Hook>
  ProjectRuleSchema &Add(List &list, Hook hook) {
    if (!hook) {
      throw SchemaConfigurationError("Visitor cannot be null");
    }
    list.push_back(std::move(hook));
    has_project_visitor_ = true;
    return *this;
  }

  std::string name_;
  ProjectContext initial_context_;
  TraversalMode mode_ = TraversalMode::kUnordered;
  ProjectVisitors<ProjectContext> project_;
  ModuleVisitorBuilder<ModuleContext> module_;
  std::optional<ContextBridge<ProjectContext, ModuleContext>> bridge_;
  std::function<Fingerprint(const ProjectContext &)> context_fingerprint_;
  bool has_project_visitor_ = false;
};

} // namespace modlint

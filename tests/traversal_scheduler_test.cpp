#include <modlint/traversal_scheduler.h>
#include <modlint/visitor_schema.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support/syntax_builders.h"

namespace modlint {
namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;
using test::Apply;
using test::At;
using test::Function;
using test::ModuleBuilder;
using test::Ref;

struct Trace {
  std::vector<std::string> *events = nullptr;
};

Diagnostics Record(Trace &trace, const std::string &event) {
  trace.events->push_back(event);
  return {};
}

std::vector<std::string> Messages(const Diagnostics &diagnostics) {
  std::vector<std::string> messages;
  for (const auto &diagnostic : diagnostics) {
    messages.push_back(diagnostic.message);
  }
  return messages;
}

struct Names {
  std::set<std::string> names;
};

ContextBridge<Names, Names> PassThroughBridge() {
  ContextBridge<Names, Names> bridge;
  bridge.to_module_context = [](const ModuleKey &, const ModuleName &,
                                const Names &project) { return project; };
  bridge.to_project_context = [](const ModuleKey &, const ModuleName &name,
                                 const Names &module) {
    Names contribution = module;
    contribution.names.insert(JoinModuleName(name));
    return contribution;
  };
  bridge.fold = [](const Names &accumulated, const Names &contribution) {
    Names folded = accumulated;
    folded.names.insert(contribution.names.begin(), contribution.names.end());
    return folded;
  };
  return bridge;
}

class OnlyPathsFilter : public RuleTargetFilter {
public:
  explicit OnlyPathsFilter(std::set<std::string> paths)
      : paths_(std::move(paths)) {}

  bool Includes(const std::string &,
                const std::filesystem::path &path) const override {
    return paths_.count(path.generic_string()) != 0;
  }

private:
  std::set<std::string> paths_;
};

TEST(TraversalSchedulerTest, VisitsModuleInFixedOrder) {
  std::vector<std::string> events;
  ModuleRuleSchema<Trace> schema("Trace", Trace{&events});
  schema
      .WithFinalModuleEvaluation([](const Trace &trace) {
        trace.events->push_back("final");
        return Diagnostics{};
      })
      .WithDeclarationExitVisitor([](const Declaration &declaration,
                                     Trace &trace) {
        return Record(trace, "declaration-exit " + declaration.name);
      })
      .WithExpressionVisitor([](const Expression &expression,
                                Direction direction, Trace &trace) {
        return Record(trace, std::string(direction == Direction::kEnter
                                             ? "enter "
                                             : "exit ") +
                                 ExpressionKindName(expression.kind));
      })
      .WithDeclarationEnterVisitor([](const Declaration &declaration,
                                      Trace &trace) {
        return Record(trace, "declaration-enter " + declaration.name);
      })
      .WithDeclarationListVisitor(
          [](const std::vector<Declaration> &, Trace &trace) {
            return Record(trace, "declarations");
          })
      .WithImportVisitor([](const Import &import, Trace &trace) {
        return Record(trace, "import " + JoinModuleName(import.module_name));
      })
      .WithCommentsVisitor([](const std::vector<Comment> &, Trace &trace) {
        return Record(trace, "comments");
      })
      .WithModuleDefinitionVisitor([](const ModuleHeader &, Trace &trace) {
        return Record(trace, "module");
      });

  const auto project = test::MustValidate(
      {ModuleBuilder("A")
           .Imports("Html")
           .Imports("Json")
           .Declares(Function("main", At(3, 1, 3, 5),
                              Apply({Ref("Html.text")}, At(3, 8, 3, 20))))
           .Build()});
  schema.ToRule()->Run(project, RunOptions{});

  EXPECT_THAT(events,
              ElementsAre("module", "comments", "import Html", "import Json",
                          "declarations", "declaration-enter main",
                          "enter application", "enter reference",
                          "exit reference", "exit application",
                          "declaration-exit main", "final"));
}

// Exit visitors run in the order they were registered, like enter visitors.
TEST(TraversalSchedulerTest, ExitVisitorsRunInRegistrationOrder) {
  std::vector<std::string> events;
  ModuleRuleSchema<Trace> schema("ExitOrder", Trace{&events});
  schema
      .WithDeclarationVisitor([](const Declaration &, Direction direction,
                                 Trace &trace) {
        return Record(trace, direction == Direction::kEnter ? "enter first"
                                                            : "exit first");
      })
      .WithDeclarationVisitor([](const Declaration &, Direction direction,
                                 Trace &trace) {
        return Record(trace, direction == Direction::kEnter ? "enter second"
                                                            : "exit second");
      });

  const auto project = test::MustValidate(
      {ModuleBuilder("A").Declares(Function("x", At(1, 1, 1, 2))).Build()});
  schema.ToRule()->Run(project, RunOptions{});

  EXPECT_THAT(events, ElementsAre("enter first", "enter second", "exit first",
                                  "exit second"));
}

TEST(TraversalSchedulerTest, SortsDiagnosticsByRange) {
  ModuleRuleSchema<Names> schema("Ranges", Names{});
  schema.WithDeclarationListVisitor(
      [](const std::vector<Declaration> &, Names &) {
        return Diagnostics{MakeError("later", {}, At(2, 5, 2, 9)),
                           MakeError("earlier", {}, At(1, 0, 1, 3))};
      });

  const auto result = schema.ToRule()->Run(
      test::MustValidate({ModuleBuilder("A").Build()}), RunOptions{});

  EXPECT_THAT(Messages(result.diagnostics), ElementsAre("earlier", "later"));
}

TEST(TraversalSchedulerTest, FoldedContextDoesNotDependOnModuleOrder) {
  auto make_rule = [] {
    ProjectRuleSchema<Names, Names> schema("Collect", Names{});
    schema.WithModuleContext(PassThroughBridge())
        .WithModuleVisitor([](ModuleVisitorBuilder<Names> &module) {
          module.WithModuleDefinitionVisitor(
              [](const ModuleHeader &, Names &) { return Diagnostics{}; });
        })
        .WithFinalProjectEvaluation([](const Names &context) {
          std::string joined;
          for (const auto &name : context.names) {
            joined += name + " ";
          }
          return Diagnostics{MakeGlobalError(joined, {})};
        });
    return schema.ToRule();
  };

  const auto forward = test::MustValidate({ModuleBuilder("A").Build(),
                                           ModuleBuilder("B").Build(),
                                           ModuleBuilder("C").Build()});
  const auto backward = test::MustValidate({ModuleBuilder("C").Build(),
                                            ModuleBuilder("B").Build(),
                                            ModuleBuilder("A").Build()});

  const auto first = make_rule()->Run(forward, RunOptions{});
  const auto second = make_rule()->Run(backward, RunOptions{});

  EXPECT_THAT(Messages(first.diagnostics), ElementsAre("A B C "));
  EXPECT_EQ(Messages(first.diagnostics), Messages(second.diagnostics));
}

TEST(TraversalSchedulerTest, ParallelVisitsMatchSequentialVisits) {
  ModuleRuleSchema<Names> schema("EveryDeclaration", Names{});
  schema.WithDeclarationEnterVisitor(
      [](const Declaration &declaration, Names &) {
        return Diagnostics{
            MakeError("Saw " + declaration.name, {}, declaration.name_range)};
      });
  const auto rule = schema.ToRule();

  std::vector<Module> modules;
  for (int i = 0; i < 12; ++i) {
    const auto name = "M" + std::to_string(i);
    modules.push_back(ModuleBuilder(name)
                          .Declares(Function("a" + name, At(i + 1, 1, i + 1, 4)))
                          .Declares(Function("b" + name, At(i + 2, 1, i + 2, 4)))
                          .Build());
  }
  const auto project = test::MustValidate(modules);

  RunOptions sequential;
  RunOptions parallel;
  parallel.worker_count = 4;
  const auto one = rule->Run(project, sequential);
  const auto many = rule->Run(project, parallel);

  ASSERT_EQ(24u, one.diagnostics.size());
  ASSERT_EQ(one.diagnostics.size(), many.diagnostics.size());
  for (std::size_t i = 0; i < one.diagnostics.size(); ++i) {
    EXPECT_EQ(one.diagnostics[i].message, many.diagnostics[i].message);
    EXPECT_EQ(one.diagnostics[i].file_path, many.diagnostics[i].file_path);
    EXPECT_EQ(one.diagnostics[i].range, many.diagnostics[i].range);
  }
}

TEST(TraversalSchedulerTest, RefusesProjectWithStaleImports) {
  ModuleRuleSchema<Names> schema("Anything", Names{});
  schema.WithImportVisitor([](const Import &, Names &) { return Diagnostics{}; });

  const auto project = test::MustValidate(
      {ModuleBuilder("A").Build(), ModuleBuilder("B").Build()});
  const auto patched = project.PatchModule(
      "src/A.elm", "module A\nimport B", ModuleBuilder("A").Imports("B").Syntax());
  ASSERT_TRUE(patched.has_value());

  EXPECT_THROW(schema.ToRule()->Run(*patched, RunOptions{}), std::logic_error);
}

TEST(TraversalSchedulerTest, ImportOrderedModulesSeeTheirUpstream) {
  ProjectRuleSchema<Names, Names> schema("Upstream", Names{});
  schema.WithModuleContext(PassThroughBridge())
      .WithContextFromImportedModules()
      .WithModuleVisitor([](ModuleVisitorBuilder<Names> &module) {
        module.WithFinalModuleEvaluation([](const Names &context) {
          std::string joined = "sees:";
          for (const auto &name : context.names) {
            joined += " " + name;
          }
          return Diagnostics{MakeError(joined, {}, {})};
        });
      });

  const auto project = test::MustValidate(
      {ModuleBuilder("Main").Imports("Page").Build(),
       ModuleBuilder("Page").Imports("Api").Build(),
       ModuleBuilder("Api").Build(), ModuleBuilder("Other").Build()});
  const auto result = schema.ToRule()->Run(project, RunOptions{});

  std::set<std::string> seen;
  for (const auto &diagnostic : result.diagnostics) {
    seen.insert(diagnostic.file_path.generic_string() + " " +
                diagnostic.message);
  }
  EXPECT_THAT(seen, UnorderedElementsAre("src/Api.elm sees:",
                                         "src/Page.elm sees: Api",
                                         "src/Main.elm sees: Api Page",
                                         "src/Other.elm sees:"));
}

TEST(TraversalSchedulerTest, ProjectHooksSeeArtifactsBeforeModules) {
  ProjectRuleSchema<Names, Names> schema("Artifacts", Names{});
  schema
      .WithReadmeProjectVisitor(
          [](const std::optional<Readme> &readme, Names &context) {
            if (readme) {
              context.names.insert("readme");
            }
            return Diagnostics{MakeError("no file to attach to", {}, {})};
          })
      .WithDirectDependenciesProjectVisitor(
          [](const DependencySet &dependencies, Names &context) {
            for (const auto &entry : dependencies) {
              context.names.insert(entry.first);
            }
            return Diagnostics{};
          })
      .WithModuleContext(PassThroughBridge())
      .WithModuleVisitor([](ModuleVisitorBuilder<Names> &module) {
        module.WithFinalModuleEvaluation([](const Names &context) {
          return Diagnostics{
              MakeError(std::to_string(context.names.size()), {}, {})};
        });
      });

  Readme readme{"README.md", "# Hello"};
  DependencySet dependencies{{"elm/core", Dependency{"elm/core", "1.0.5", {}}}};
  const auto project = test::MustValidate({ModuleBuilder("A").Build()},
                                          std::nullopt, readme, dependencies);
  const auto result = schema.ToRule()->Run(project, RunOptions{});

  ASSERT_EQ(2u, result.diagnostics.size());
  const auto global = std::find_if(
      result.diagnostics.begin(), result.diagnostics.end(),
      [](const Diagnostic &diagnostic) {
        return diagnostic.location == DiagnosticLocation::kGlobal;
      });
  ASSERT_NE(result.diagnostics.end(), global);
  EXPECT_EQ("no file to attach to", global->message);
  const auto module = std::find_if(
      result.diagnostics.begin(), result.diagnostics.end(),
      [](const Diagnostic &diagnostic) {
        return diagnostic.location == DiagnosticLocation::kModule;
      });
  ASSERT_NE(result.diagnostics.end(), module);
  EXPECT_EQ("2", module->message);
}

TEST(TraversalSchedulerTest, FilteredModulesAreNotVisited) {
  ProjectRuleSchema<Names, Names> schema("Filtered", Names{});
  schema.WithModuleContext(PassThroughBridge())
      .WithModuleVisitor([](ModuleVisitorBuilder<Names> &module) {
        module.WithModuleDefinitionVisitor(
            [](const ModuleHeader &header, Names &) {
              return Diagnostics{
                  MakeError("visited " + JoinModuleName(header.name), {}, {})};
            });
      })
      .WithFinalProjectEvaluation([](const Names &context) {
        return Diagnostics{
            MakeGlobalError(std::to_string(context.names.size()), {})};
      });

  const auto project = test::MustValidate(
      {ModuleBuilder("A").Build(), ModuleBuilder("B").Build()});
  OnlyPathsFilter filter({"src/B.elm"});
  RunOptions options;
  options.target_filter = &filter;
  const auto result = schema.ToRule()->Run(project, options);

  EXPECT_THAT(Messages(result.diagnostics),
              UnorderedElementsAre("visited B", "1"));
  EXPECT_FALSE(result.cache.Contains({"A"}));
  EXPECT_TRUE(result.cache.Contains({"B"}));
}

std::unique_ptr<Rule> ReportOnlyInSourceDirectories() {
  ProjectRuleSchema<Names, Names> schema("SourcesOnly", Names{});
  ContextBridge<Names, Names> bridge = PassThroughBridge();
  bridge.to_module_context = [](const ModuleKey &key, const ModuleName &,
                                const Names &) {
    Names context;
    if (!key.is_in_source_directories) {
      context.names.insert("outside:" + key.path.generic_string());
    }
    return context;
  };
  schema.WithModuleContext(bridge).WithModuleVisitor(
      [](ModuleVisitorBuilder<Names> &module) {
        module.WithFinalModuleEvaluation([](const Names &context) {
          if (!context.names.empty()) {
            return Diagnostics{};
          }
          return Diagnostics{MakeError("reported", {}, {})};
        });
      });
  return schema.ToRule();
}

TEST(TraversalSchedulerTest, RulesSeeWhetherModuleIsInSourceDirectories) {
  auto test_module = ModuleBuilder("MainTest").Path("tests/MainTest.elm").Build();
  test_module.is_in_source_directories = false;
  const auto project =
      test::MustValidate({ModuleBuilder("Main").Build(), test_module});
  const auto rule = ReportOnlyInSourceDirectories();

  const auto result = rule->Run(project, RunOptions{});

  ASSERT_EQ(1u, result.diagnostics.size());
  EXPECT_EQ(std::filesystem::path("src/Main.elm"),
            result.diagnostics[0].file_path);
}

TEST(TraversalSchedulerTest, MovingModuleIntoSourceDirectoriesMissesCache) {
  auto test_module = ModuleBuilder("MainTest").Path("tests/MainTest.elm").Build();
  test_module.is_in_source_directories = false;
  const auto rule = ReportOnlyInSourceDirectories();
  const auto before = rule->Run(
      test::MustValidate({ModuleBuilder("Main").Build(), test_module}),
      RunOptions{});

  test_module.is_in_source_directories = true;
  auto project = test::MustValidate({ModuleBuilder("Main").Build(), test_module});
  AnalysisCache cache;
  cache.Put("SourcesOnly", before.cache);
  const auto after = rule->Run(project.WithCache(cache), RunOptions{});

  EXPECT_THAT(after.cache_statistics.reused, ElementsAre(ModuleName{"Main"}));
  EXPECT_THAT(after.cache_statistics.recomputed,
              ElementsAre(ModuleName{"MainTest"}));
  EXPECT_EQ(2u, after.diagnostics.size());
}

TEST(TraversalSchedulerTest, SchedulerExposesFinalStateAndContext) {
  CompiledRule<Names, Names> compiled{"Direct", Names{}};
  compiled.module = ModuleVisitors<Names>{};
  compiled.module->module_definition.push_back(
      [](const ModuleHeader &, Names &) { return Diagnostics{}; });
  compiled.bridge = PassThroughBridge();

  TraversalScheduler<Names, Names> scheduler(compiled, RunOptions{});
  EXPECT_EQ(TraversalState::kNotStarted, scheduler.State());
  scheduler.Run(test::MustValidate(
      {ModuleBuilder("A").Build(), ModuleBuilder("B").Build()}));

  EXPECT_EQ(TraversalState::kDone, scheduler.State());
  EXPECT_STREQ("done", TraversalStateName(scheduler.State()));
  ASSERT_TRUE(scheduler.FinalContext().has_value());
  EXPECT_THAT(scheduler.FinalContext()->names, ElementsAre("A", "B"));
}

} // namespace
} // namespace modlint

#include <modlint/analysis_pipeline_builder.h>
#include <modlint/default_analysis_pipeline.h>
#include <modlint/visitor_schema.h>
#include <modlint/yaml_project_loader.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "test_support/sample_snapshot.h"
#include "test_support/temporary_project.h"

namespace modlint {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class StubProjectLoader : public ProjectLoader {
public:
  explicit StubProjectLoader(std::string snapshot)
      : snapshot_(std::move(snapshot)) {}

  ProjectInputs Load(const AnalysisConfig &) override {
    return ParseProjectSnapshot(snapshot_);
  }

private:
  std::string snapshot_;
};

class CountingReporter : public Reporter {
public:
  explicit CountingReporter(std::vector<std::size_t> *counts)
      : counts_(counts) {}

  Report Render(const ReviewOutcome &outcome,
                const AnalysisConfig &) override {
    counts_->push_back(outcome.diagnostics.size());
    return Report{"custom-report", ""};
  }

private:
  std::vector<std::size_t> *counts_;
};

struct Nothing {};

std::unique_ptr<Rule> MakeModuleCounter() {
  ModuleRuleSchema<Nothing> schema("ModuleCounter", Nothing{});
  schema.WithModuleDefinitionVisitor([](const ModuleHeader &header, Nothing &) {
    return Diagnostics{
        MakeError("module " + JoinModuleName(header.name), {}, header.range)};
  });
  return schema.ToRule();
}

std::vector<std::string> RuleNames(const Diagnostics &diagnostics) {
  std::vector<std::string> names;
  for (const auto &diagnostic : diagnostics) {
    names.push_back(diagnostic.rule_name);
  }
  return names;
}

TEST(AnalysisPipelineTest, RunsDefaultRulesOverSnapshotFile) {
  test::TemporaryProject project;
  const auto path = project.AddFile("project.yml", test::kSampleSnapshot);
  AnalysisConfig config;
  config.project_path = path.string();
  config.formats = {"text", "json"};

  auto pipeline = AnalysisPipelineBuilder().Build();
  const auto result = pipeline.Run(config);

  EXPECT_THAT(RuleNames(result.outcome.diagnostics),
              ElementsAre("NoDebug", "NoUnused.Declarations"));
  EXPECT_THAT(result.report.text, HasSubstr("src/Main.elm\n"));
  EXPECT_THAT(result.report.text,
              HasSubstr("3:8-3:17  [NoDebug] Remove the use of `Debug.log`"));
  EXPECT_THAT(result.report.text,
              HasSubstr("4:1-4:7  [NoUnused.Declarations] Top-level "
                        "declaration `helper` is not used"));
  EXPECT_THAT(result.report.text, HasSubstr("2 diagnostics in 1 file\n"));
  EXPECT_THAT(result.report.json, HasSubstr("\"summary\": {\"diagnostics\": 2}"));
}

TEST(AnalysisPipelineTest, UsesCustomComponents) {
  std::vector<std::size_t> counts;
  AnalysisPipelineBuilder builder;
  builder
      .WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot))
      .WithReporter(std::make_unique<CountingReporter>(&counts))
      .WithRule(MakeModuleCounter());

  auto pipeline = builder.Build();
  const auto result = pipeline.Run(AnalysisConfig{});

  EXPECT_EQ("custom-report", result.report.text);
  EXPECT_THAT(counts, ElementsAre(2u));
  EXPECT_THAT(RuleNames(result.outcome.diagnostics),
              ElementsAre("ModuleCounter", "ModuleCounter"));
}

TEST(AnalysisPipelineTest, ExplicitRulesRunBeforeNamedOnes) {
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot))
      .WithRule(MakeModuleCounter())
      .WithRuleNames({"NoDebug"});

  auto pipeline = builder.Build();
  pipeline.Run(AnalysisConfig{});

  ASSERT_NE(nullptr, pipeline.Session());
  EXPECT_THAT(pipeline.Session()->RuleNames(),
              ElementsAre("ModuleCounter", "NoDebug"));
}

TEST(AnalysisPipelineTest, RejectsNullAndUnknownRules) {
  AnalysisPipelineBuilder builder;
  EXPECT_THROW(builder.WithRule(nullptr), std::invalid_argument);

  builder.WithRuleNames({"NoSuchRule"});
  EXPECT_THROW(builder.Build(), std::invalid_argument);
}

TEST(AnalysisPipelineTest, InvalidProjectIsReportedNotThrown) {
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kCyclicSnapshot));

  auto pipeline = builder.Build();
  const auto result = pipeline.Run(AnalysisConfig{});

  ASSERT_TRUE(result.outcome.project_error.has_value());
  EXPECT_THAT(result.outcome.diagnostics, IsEmpty());
  EXPECT_THAT(result.report.text, HasSubstr("[ProjectValidation]"));
  EXPECT_THAT(result.report.text, HasSubstr("A -> B -> A"));
}

TEST(AnalysisPipelineTest, IgnoredPathsSkipModules) {
  AnalysisConfig config;
  config.rule_ignored_paths = {{"NoDebug", {"src/Main.elm"}}};
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot));

  auto pipeline = builder.Build();
  const auto result = pipeline.Run(config);

  EXPECT_THAT(RuleNames(result.outcome.diagnostics),
              ElementsAre("NoUnused.Declarations"));
}

TEST(AnalysisPipelineTest, SecondRunReusesTheCache) {
  std::ostringstream log_stream;
  auto logger = MakeLogger({LogLevel::kDebug}, log_stream);
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot))
      .WithLogger(logger);

  auto pipeline = builder.Build();
  const auto first = pipeline.Run(AnalysisConfig{});
  const auto second = pipeline.Run(AnalysisConfig{});

  for (const auto &[rule, statistics] : first.outcome.cache_statistics) {
    EXPECT_THAT(statistics.reused, IsEmpty()) << rule;
  }
  for (const auto &[rule, statistics] : second.outcome.cache_statistics) {
    EXPECT_EQ(2u, statistics.reused.size()) << rule;
    EXPECT_THAT(statistics.recomputed, IsEmpty()) << rule;
  }
  EXPECT_EQ(first.report.text, second.report.text);
  EXPECT_THAT(log_stream.str(), HasSubstr("pipeline.complete"));
  EXPECT_THAT(log_stream.str(), HasSubstr("module.cache.hit"));
}

TEST(AnalysisPipelineTest, DisabledCacheRecomputesEveryRun) {
  AnalysisConfig config;
  config.use_cache = false;
  config.worker_count = 3;
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot));

  auto pipeline = builder.Build();
  pipeline.Run(config);
  const auto second = pipeline.Run(config);

  for (const auto &[rule, statistics] : second.outcome.cache_statistics) {
    EXPECT_THAT(statistics.reused, IsEmpty()) << rule;
    EXPECT_EQ(2u, statistics.recomputed.size()) << rule;
  }
  EXPECT_EQ(2u, second.outcome.diagnostics.size());
}

TEST(AnalysisPipelineTest, EachRunAppliesItsOwnConfig) {
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot));
  auto pipeline = builder.Build();

  const auto first = pipeline.Run(AnalysisConfig{});

  AnalysisConfig narrowed;
  narrowed.rule_ignored_paths = {{"NoDebug", {"src/Main.elm"}}};
  narrowed.use_cache = false;
  const auto second = pipeline.Run(narrowed);

  EXPECT_THAT(RuleNames(first.outcome.diagnostics),
              ElementsAre("NoDebug", "NoUnused.Declarations"));
  EXPECT_THAT(RuleNames(second.outcome.diagnostics),
              ElementsAre("NoUnused.Declarations"));
  EXPECT_THAT(second.outcome.cache_statistics.at("NoDebug").reused, IsEmpty());
  EXPECT_EQ(1u, second.outcome.cache_statistics.at("NoDebug").recomputed.size());
  EXPECT_THAT(second.outcome.cache_statistics.at("NoUnused.Declarations").reused,
              IsEmpty());
  ASSERT_NE(nullptr, pipeline.Session());
  EXPECT_FALSE(pipeline.Session()->Options().use_cache);
}

TEST(AnalysisPipelineTest, ChangedIgnoredPathsDropTheCache) {
  AnalysisPipelineBuilder builder;
  builder.WithLoader(std::make_unique<StubProjectLoader>(test::kSampleSnapshot));
  auto pipeline = builder.Build();

  pipeline.Run(AnalysisConfig{});
  AnalysisConfig ignoring_api;
  ignoring_api.ignored_paths = {"src/Api.elm"};
  const auto second = pipeline.Run(ignoring_api);
  const auto third = pipeline.Run(ignoring_api);

  for (const auto &[rule, statistics] : second.outcome.cache_statistics) {
    EXPECT_THAT(statistics.reused, IsEmpty()) << rule;
    EXPECT_EQ(1u, statistics.recomputed.size()) << rule;
  }
  for (const auto &[rule, statistics] : third.outcome.cache_statistics) {
    EXPECT_EQ(1u, statistics.reused.size()) << rule;
    EXPECT_THAT(statistics.recomputed, IsEmpty()) << rule;
  }
}

} // namespace
} // namespace modlint

#include <modlint/valid_project.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>
#include <vector>

#include "test_support/syntax_builders.h"

namespace modlint {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using test::ModuleBuilder;

template <typename Error>
const Error &ExpectError(const ValidationResult &result) {
  const auto *error = std::get_if<InvalidProjectError>(&result);
  if (error == nullptr || !std::holds_alternative<Error>(*error)) {
    throw std::runtime_error("validation did not fail with the expected error");
  }
  return std::get<Error>(*error);
}

std::vector<ModuleName> Names(const std::vector<ModulePtr> &modules) {
  std::vector<ModuleName> names;
  for (const auto &module : modules) {
    names.push_back(module->Name());
  }
  return names;
}

TEST(ValidProjectTest, ReportsEveryModuleThatFailedToParse) {
  const auto result = ValidateProject(
      {test::Unparsed("src/A.elm", "module A exposing"),
       ModuleBuilder("B").Build(), test::Unparsed("src/C.elm", "import")},
      std::nullopt, std::nullopt, {});

  const auto &error = ExpectError<ModulesFailedToParse>(result);
  EXPECT_THAT(error.paths, ElementsAre(std::filesystem::path("src/A.elm"),
                                       std::filesystem::path("src/C.elm")));
}

TEST(ValidProjectTest, ParseFailuresWinOverOtherProblems) {
  const auto result = ValidateProject(
      {ModuleBuilder("A").Imports("A").Build(),
       ModuleBuilder("A").Path("lib/A.elm").Build(),
       test::Unparsed("src/Broken.elm", "")},
      std::nullopt, std::nullopt, {});

  EXPECT_NO_THROW(ExpectError<ModulesFailedToParse>(result));
}

TEST(ValidProjectTest, RejectsEmptyProject) {
  const auto result = ValidateProject({}, std::nullopt, std::nullopt, {});

  EXPECT_NO_THROW(ExpectError<NoModules>(result));
}

TEST(ValidProjectTest, ReportsAllPathsOfDuplicatedName) {
  const auto result = ValidateProject(
      {ModuleBuilder("Page.Home").Path("src/Page/Home.elm").Build(),
       ModuleBuilder("Api").Build(),
       ModuleBuilder("Page.Home").Path("tests/Page/Home.elm").Build()},
      std::nullopt, std::nullopt, {});

  const auto &error = ExpectError<DuplicateModuleNames>(result);
  EXPECT_EQ((ModuleName{"Page", "Home"}), error.name);
  EXPECT_THAT(error.paths,
              ElementsAre(std::filesystem::path("src/Page/Home.elm"),
                          std::filesystem::path("tests/Page/Home.elm")));
}

TEST(ValidProjectTest, ReportsImportCycleWithPaths) {
  const auto result =
      ValidateProject({ModuleBuilder("A").Imports("B").Build(),
                       ModuleBuilder("B").Imports("A").Build()},
                      std::nullopt, std::nullopt, {});

  const auto &error = ExpectError<ImportCycle>(result);
  EXPECT_THAT(error.modules, ElementsAre(ModuleName{"A"}, ModuleName{"B"}));
  EXPECT_THAT(error.paths, ElementsAre(std::filesystem::path("src/A.elm"),
                                       std::filesystem::path("src/B.elm")));
  EXPECT_THAT(DescribeError(InvalidProjectError{error}),
              HasSubstr("A -> B -> A"));
}

TEST(ValidProjectTest, SortsModulesInImportOrder) {
  const auto project = test::MustValidate(
      {ModuleBuilder("Main").Imports("Page").Build(),
       ModuleBuilder("Page").Imports("Api").Build(),
       ModuleBuilder("Api").Build()});

  EXPECT_THAT(Names(project.SortedModules()),
              ElementsAre(ModuleName{"Api"}, ModuleName{"Page"},
                          ModuleName{"Main"}));
  EXPECT_THAT(Names(project.Modules()),
              ElementsAre(ModuleName{"Main"}, ModuleName{"Page"},
                          ModuleName{"Api"}));
}

TEST(ValidProjectTest, CursorWalksTheSortedModules) {
  const auto project = test::MustValidate(
      {ModuleBuilder("A").Imports("B").Build(), ModuleBuilder("B").Build()});

  auto cursor = project.Cursor();
  ASSERT_EQ(2u, cursor.Size());
  EXPECT_EQ((ModuleName{"B"}), cursor.Current().Name());
  cursor.Advance();
  EXPECT_EQ(1u, cursor.Position());
  EXPECT_EQ((ModuleName{"A"}), cursor.Current().Name());
  cursor.Advance();
  EXPECT_TRUE(cursor.AtEnd());
  EXPECT_THROW(cursor.Current(), std::out_of_range);
  cursor.Reset();
  EXPECT_EQ((ModuleName{"B"}), cursor.Current().Name());
}

TEST(ValidProjectTest, LooksUpModulesAndTheirImports) {
  const auto project = test::MustValidate(
      {ModuleBuilder("A").Imports("B").Imports("C").Imports("Html").Build(),
       ModuleBuilder("B").Build(), ModuleBuilder("C").Build()});

  const auto *a = project.FindModuleByPath("src/./A.elm");
  ASSERT_NE(nullptr, a);
  EXPECT_EQ(a, project.FindModuleByName({"A"}));
  EXPECT_EQ(nullptr, project.FindModuleByName({"Html"}));

  const auto imports = project.DirectImportsOf(*a);
  ASSERT_EQ(2u, imports.size());
  EXPECT_EQ((ModuleName{"B"}), imports[0]->Name());
  EXPECT_EQ((ModuleName{"C"}), imports[1]->Name());
}

TEST(ValidProjectTest, DirectDependenciesFallBackToAllWithoutManifest) {
  DependencySet dependencies{{"elm/core", Dependency{"elm/core", "1.0.5", {}}},
                             {"elm/json", Dependency{"elm/json", "1.1.3", {}}}};

  const auto without_manifest = test::MustValidate(
      {ModuleBuilder("A").Build()}, std::nullopt, std::nullopt, dependencies);
  EXPECT_EQ(2u, without_manifest.DirectDependencies().size());

  Manifest manifest;
  manifest.dependencies = {"elm/core"};
  const auto with_manifest = test::MustValidate(
      {ModuleBuilder("A").Build()}, manifest, std::nullopt, dependencies);
  const auto direct = with_manifest.DirectDependencies();
  ASSERT_EQ(1u, direct.size());
  EXPECT_EQ(1u, direct.count("elm/core"));
}

TEST(ValidProjectTest, PatchRejectsUnknownPathAndRenamedModule) {
  const auto project = test::MustValidate({ModuleBuilder("A").Build()});

  EXPECT_FALSE(project
                   .PatchModule("src/Other.elm", "module Other",
                                ModuleBuilder("Other").Syntax())
                   .has_value());
  EXPECT_FALSE(project
                   .PatchModule("src/A.elm", "module Renamed",
                                ModuleBuilder("Renamed").Syntax())
                   .has_value());
}

TEST(ValidProjectTest, PatchKeepsOrderWhenImportsAreUnchanged) {
  const auto project = test::MustValidate(
      {ModuleBuilder("A").Imports("B").Build(), ModuleBuilder("B").Build()});

  const auto edited =
      ModuleBuilder("A").Imports("B").Comments("-- reworded").Syntax();
  const auto patched = project.PatchModule("src/A.elm", "edited", edited);

  ASSERT_TRUE(patched.has_value());
  EXPECT_FALSE(patched->NeedsRevalidation());
  EXPECT_THAT(Names(patched->SortedModules()),
              ElementsAre(ModuleName{"B"}, ModuleName{"A"}));
  EXPECT_EQ("edited", patched->FindModuleByName({"A"})->source);
  EXPECT_NE("edited", project.FindModuleByName({"A"})->source);
}

TEST(ValidProjectTest, PatchChangingImportsRequiresRevalidation) {
  const auto project = test::MustValidate(
      {ModuleBuilder("A").Imports("B").Build(), ModuleBuilder("B").Build()});

  const auto patched = project.PatchModule(
      "src/B.elm", "module B\nimport A", ModuleBuilder("B").Imports("A").Syntax());

  ASSERT_TRUE(patched.has_value());
  EXPECT_TRUE(patched->NeedsRevalidation());
  const auto revalidated = patched->Revalidate();
  EXPECT_NO_THROW(ExpectError<ImportCycle>(revalidated));
}

TEST(ValidProjectTest, RevalidateKeepsTheCache) {
  auto project = test::MustValidate({ModuleBuilder("A").Build()});
  AnalysisCache cache;
  cache.Put("SomeRule", RuleCache{});
  project = project.WithCache(cache);

  const auto result = project.Revalidate();

  ASSERT_TRUE(std::holds_alternative<ValidProject>(result));
  EXPECT_THAT(std::get<ValidProject>(result).Cache().RuleNames(),
              ElementsAre("SomeRule"));
}

} // namespace
} // namespace modlint

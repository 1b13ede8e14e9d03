#include <modlint/rules/no_debug.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/syntax_builders.h"

namespace modlint {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using test::Apply;
using test::At;
using test::Function;
using test::Literal;
using test::ModuleBuilder;
using test::Ref;

Diagnostics Run(const Module &module) {
  return rules::MakeNoDebugRule()
      ->Run(test::MustValidate({module}), RunOptions{})
      .diagnostics;
}

TEST(NoDebugTest, ReportsQualifiedDebugLog) {
  const auto module =
      ModuleBuilder("Main")
          .Declares(Function("main", At(3, 1, 3, 5),
                             Apply({Ref("Debug.log", At(4, 5, 4, 14)),
                                    Literal("\"x\"", At(4, 15, 4, 18))},
                                   At(4, 5, 4, 18))))
          .Build();

  const auto diagnostics = modlint::Run(module);

  ASSERT_EQ(1u, diagnostics.size());
  EXPECT_EQ("Remove the use of `Debug.log` before shipping to production",
            diagnostics[0].message);
  EXPECT_EQ(At(4, 5, 4, 14), diagnostics[0].range);
  EXPECT_EQ("NoDebug", diagnostics[0].rule_name);
  EXPECT_EQ(std::filesystem::path("src/Main.elm"), diagnostics[0].file_path);
}

TEST(NoDebugTest, FollowsImportAlias) {
  const auto module =
      ModuleBuilder("Main")
          .ImportsAs("Debug", "D")
          .Declares(Function("main", At(3, 1, 3, 5),
                             Ref("D.todo", At(3, 8, 3, 14))))
          .Build();

  const auto diagnostics = modlint::Run(module);

  ASSERT_EQ(1u, diagnostics.size());
  EXPECT_THAT(diagnostics[0].message, HasSubstr("Debug.todo"));
}

TEST(NoDebugTest, ReportsExposedFunctionsOnly) {
  const auto module =
      ModuleBuilder("Main")
          .Imports("Debug", {"toString"})
          .Declares(Function("main", At(3, 1, 3, 5),
                             Apply({Ref("toString", At(3, 8, 3, 16)),
                                    Ref("log", At(3, 17, 3, 20))},
                                   At(3, 8, 3, 20))))
          .Build();

  const auto diagnostics = modlint::Run(module);

  ASSERT_EQ(1u, diagnostics.size());
  EXPECT_THAT(diagnostics[0].message, HasSubstr("Debug.toString"));
}

TEST(NoDebugTest, IgnoresOtherModulesAndFunctions) {
  const auto module =
      ModuleBuilder("Main")
          .Declares(Function("main", At(3, 1, 3, 5),
                             Apply({Ref("Logger.log", At(3, 8, 3, 18)),
                                    Ref("Debug.other", At(3, 19, 3, 30)),
                                    Ref("log", At(3, 31, 3, 34))},
                                   At(3, 8, 3, 34))))
          .Build();

  EXPECT_THAT(modlint::Run(module), IsEmpty());
}

} // namespace
} // namespace modlint

#include <modlint/rules/no_debug.h>

#include <modlint/visitor_schema.h>

#include <set>
#include <string>

namespace modlint::rules {
namespace {

const std::set<std::string> &DebugFunctions() {
  static const std::set<std::string> functions{"log", "todo", "toString"};
  return functions;
}

struct DebugImports {
  std::set<std::string> qualifiers{"Debug"};
  std::set<std::string> exposed;
};

bool IsDebugModule(const ModuleName &name) {
  return name.size() == 1 && name.front() == "Debug";
}

} // namespace

std::unique_ptr<Rule> MakeNoDebugRule() {
  ModuleRuleSchema<DebugImports> schema(kNoDebugName, DebugImports{});
  schema
      .WithImportVisitor([](const Import &import, DebugImports &imports) {
        if (!IsDebugModule(import.module_name)) {
          return Diagnostics{};
        }
        if (import.alias) {
          imports.qualifiers.insert(*import.alias);
        }
        for (const auto &name : import.exposed) {
          if (DebugFunctions().count(name) != 0) {
            imports.exposed.insert(name);
          }
        }
        if (import.exposing_all) {
          imports.exposed = DebugFunctions();
        }
        return Diagnostics{};
      })
      .WithExpressionEnterVisitor([](const Expression &expression,
                                     DebugImports &imports) {
        if (expression.kind != ExpressionKind::kReference ||
            DebugFunctions().count(expression.name) == 0) {
          return Diagnostics{};
        }
        const bool qualified =
            !expression.qualifier.empty() &&
            imports.qualifiers.count(JoinModuleName(expression.qualifier)) != 0;
        const bool exposed = expression.qualifier.empty() &&
                             imports.exposed.count(expression.name) != 0;
        if (!qualified && !exposed) {
          return Diagnostics{};
        }
        return Diagnostics{MakeError(
            "Remove the use of `Debug." + expression.name +
                "` before shipping to production",
            {"Debug functions are useful during development but must not "
             "reach a release build."},
            expression.range)};
      });
  return schema.ToRule();
}

} // namespace modlint::rules

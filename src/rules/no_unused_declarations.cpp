#include <modlint/rules/no_unused_declarations.h>

#include <modlint/visitor_schema.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace modlint::rules {
namespace {

struct TrackedImport {
  ModuleName module_name;
  std::string qualifier;
  bool exposing_all = false;
  std::set<std::string> exposed;
  Range range;
  bool used = false;
};

struct Candidate {
  std::string name;
  DeclarationKind kind;
  Range name_range;
};

struct ModuleState {
  std::map<ModuleName, std::set<std::string>> upstream;
  ModuleName name;
  bool exposing_all = false;
  std::set<std::string> exposed;
  std::set<std::string> top_level;
  std::vector<Candidate> candidates;
  std::vector<TrackedImport> imports;
  std::set<std::string> referenced;
  std::string current_declaration;
};

// "Type(..)" exposes the type and its constructors; only the type name
// matters here.
std::string ExposedName(const std::string &entry) {
  const auto open = entry.find('(');
  if (open == std::string::npos || open == 0) {
    return entry;
  }
  return entry.substr(0, open);
}

std::set<std::string> ExposedNames(const std::vector<std::string> &entries) {
  std::set<std::string> names;
  for (const auto &entry : entries) {
    names.insert(ExposedName(entry));
  }
  return names;
}

bool IsCandidate(DeclarationKind kind) {
  return kind == DeclarationKind::kFunction ||
         kind == DeclarationKind::kTypeAlias;
}

void MarkUnqualifiedUse(ModuleState &state, const std::string &name) {
  if (state.top_level.count(name) != 0) {
    if (name != state.current_declaration) {
      state.referenced.insert(name);
    }
    return;
  }
  for (auto &import : state.imports) {
    if (import.exposed.count(name) != 0) {
      import.used = true;
      continue;
    }
    if (import.exposing_all) {
      const auto api = state.upstream.find(import.module_name);
      if (api != state.upstream.end() && api->second.count(name) != 0) {
        import.used = true;
      }
    }
  }
}

void MarkQualifiedUse(ModuleState &state, const ModuleName &qualifier) {
  const auto joined = JoinModuleName(qualifier);
  for (auto &import : state.imports) {
    if (import.qualifier == joined) {
      import.used = true;
    }
  }
}

Diagnostics ReportUnused(const ModuleState &state) {
  Diagnostics diagnostics;
  for (const auto &candidate : state.candidates) {
    if (state.exposing_all || state.exposed.count(candidate.name) != 0 ||
        state.referenced.count(candidate.name) != 0) {
      continue;
    }
    const std::string what = candidate.kind == DeclarationKind::kTypeAlias
                                 ? "Type alias"
                                 : "Top-level declaration";
    diagnostics.push_back(MakeError(
        what + " `" + candidate.name + "` is not used",
        {"This declaration is neither exposed nor referenced in " +
             JoinModuleName(state.name) + ".",
         "Remove it or expose it from the module."},
        candidate.name_range));
  }
  for (const auto &import : state.imports) {
    // Only imports of project modules are resolvable.
    if (import.used || state.upstream.count(import.module_name) == 0) {
      continue;
    }
    diagnostics.push_back(MakeError(
        "Imported module `" + JoinModuleName(import.module_name) +
            "` is not used",
        {"Nothing from this import is referenced in " +
             JoinModuleName(state.name) + "."},
        import.range));
  }
  return diagnostics;
}

Fingerprint FingerprintApi(const ExposedApi &api) {
  Fingerprint fingerprint = 0;
  for (const auto &[module, names] : api.exposed_by_module) {
    fingerprint =
        CombineFingerprints(fingerprint, FingerprintText(JoinModuleName(module)));
    for (const auto &name : names) {
      fingerprint = CombineFingerprints(fingerprint, FingerprintText(name));
    }
  }
  return fingerprint;
}

} // namespace

std::unique_ptr<Rule> MakeNoUnusedDeclarationsRule() {
  ProjectRuleSchema<ExposedApi, ModuleState> schema(kNoUnusedDeclarationsName,
                                                    ExposedApi{});

  ContextBridge<ExposedApi, ModuleState> bridge;
  bridge.to_module_context = [](const ModuleKey &, const ModuleName &name,
                                const ExposedApi &api) {
    ModuleState state;
    state.upstream = api.exposed_by_module;
    state.name = name;
    return state;
  };
  bridge.to_project_context = [](const ModuleKey &, const ModuleName &name,
                                 const ModuleState &state) {
    ExposedApi api;
    api.exposed_by_module[name] =
        state.exposing_all ? state.top_level : state.exposed;
    return api;
  };
  bridge.fold = [](const ExposedApi &accumulated, const ExposedApi &next) {
    ExposedApi merged = accumulated;
    for (const auto &[module, names] : next.exposed_by_module) {
      merged.exposed_by_module[module].insert(names.begin(), names.end());
    }
    return merged;
  };

  schema.WithContextFromImportedModules()
      .WithModuleContext(std::move(bridge))
      .WithContextFingerprint(FingerprintApi)
      .WithModuleVisitor([](ModuleVisitorBuilder<ModuleState> &visitors) {
        visitors
            .WithModuleDefinitionVisitor(
                [](const ModuleHeader &header, ModuleState &state) {
                  state.exposing_all = header.exposing_all;
                  state.exposed = ExposedNames(header.exposed);
                  return Diagnostics{};
                })
            .WithImportVisitor([](const Import &import, ModuleState &state) {
              TrackedImport tracked;
              tracked.module_name = import.module_name;
              tracked.qualifier =
                  import.alias ? *import.alias
                               : JoinModuleName(import.module_name);
              tracked.exposing_all = import.exposing_all;
              tracked.exposed = ExposedNames(import.exposed);
              tracked.range = import.range;
              state.imports.push_back(std::move(tracked));
              return Diagnostics{};
            })
            .WithDeclarationListVisitor(
                [](const std::vector<Declaration> &declarations,
                   ModuleState &state) {
                  for (const auto &declaration : declarations) {
                    state.top_level.insert(declaration.name);
                    if (IsCandidate(declaration.kind)) {
                      state.candidates.push_back({declaration.name,
                                                  declaration.kind,
                                                  declaration.name_range});
                    }
                  }
                  return Diagnostics{};
                })
            .WithDeclarationVisitor([](const Declaration &declaration,
                                       Direction direction,
                                       ModuleState &state) {
              state.current_declaration =
                  direction == Direction::kEnter ? declaration.name : "";
              if (direction == Direction::kEnter) {
                for (const auto &type : declaration.type_references) {
                  if (type.qualifier.empty()) {
                    MarkUnqualifiedUse(state, type.name);
                  } else {
                    MarkQualifiedUse(state, type.qualifier);
                  }
                }
              }
              return Diagnostics{};
            })
            .WithExpressionEnterVisitor(
                [](const Expression &expression, ModuleState &state) {
                  if (expression.kind != ExpressionKind::kReference) {
                    return Diagnostics{};
                  }
                  if (expression.qualifier.empty()) {
                    MarkUnqualifiedUse(state, expression.name);
                  } else {
                    MarkQualifiedUse(state, expression.qualifier);
                  }
                  return Diagnostics{};
                })
            .WithFinalModuleEvaluation(ReportUnused);
      });
  return schema.ToRule();
}

} // namespace modlint::rules

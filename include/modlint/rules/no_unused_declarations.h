#pragma once

#include <modlint/rule.h>

#include <map>
#include <memory>
#include <set>
#include <string>

namespace modlint::rules {

inline constexpr const char kNoUnusedDeclarationsName[] =
    "NoUnused.Declarations";

// Public API of the modules seen so far, keyed by module name.
struct ExposedApi {
  std::map<ModuleName, std::set<std::string>> exposed_by_module;
};

// Reports top-level values and type aliases that are neither exposed nor
// referenced inside their module, and imports of project modules from which
// nothing is used. Modules are visited in import order so that an
// `exposing (..)` import can be resolved against the imported module's API.
std::unique_ptr<Rule> MakeNoUnusedDeclarationsRule();

} // namespace modlint::rules

#pragma once

#include <modlint/rule.h>

#include <memory>

namespace modlint::rules {

inline constexpr const char kNoDebugName[] = "NoDebug";

// Reports references to Debug.log, Debug.todo and Debug.toString, including
// aliased and exposed forms.
std::unique_ptr<Rule> MakeNoDebugRule();

} // namespace modlint::rules

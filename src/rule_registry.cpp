#include <modlint/rule_registry.h>

#include <modlint/rules/no_debug.h>
#include <modlint/rules/no_unused_declarations.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace modlint {

void RuleRegistry::RegisterRule(const std::string &name, RuleFactory factory,
                                bool enabled_by_default) {
  if (name.empty()) {
    throw std::invalid_argument("Rule name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (factories_.count(name) != 0) {
    throw std::invalid_argument("Rule with name '" + name +
                                "' already registered");
  }
  factories_.emplace(name, std::move(factory));
  if (enabled_by_default) {
    default_names_.push_back(name);
  }
}

std::unique_ptr<Rule> RuleRegistry::CreateRule(const std::string &name) const {
  const auto found = factories_.find(name);
  if (found == factories_.end()) {
    throw std::invalid_argument("Unknown rule '" + name +
                                "'. Registered: " + JoinNames());
  }
  auto rule = found->second();
  if (!rule) {
    throw std::runtime_error("Factory for rule '" + name + "' returned null");
  }
  if (rule->Name() != name) {
    throw std::runtime_error("Factory for rule '" + name +
                             "' built a rule named '" + rule->Name() + "'");
  }
  return rule;
}

std::vector<std::unique_ptr<Rule>>
RuleRegistry::CreateRules(const std::vector<std::string> &names) const {
  const auto &selected = names.empty() ? default_names_ : names;
  std::vector<std::unique_ptr<Rule>> rules;
  std::set<std::string> seen;
  for (const auto &name : selected) {
    if (!seen.insert(name).second) {
      continue;
    }
    rules.push_back(CreateRule(name));
  }
  return rules;
}

std::vector<std::string> RuleRegistry::RuleNames() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto &entry : factories_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::string RuleRegistry::JoinNames() const {
  const auto names = RuleNames();
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

RuleRegistry MakeRuleRegistryWithDefaults() {
  RuleRegistry registry;
  registry.RegisterRule(rules::kNoUnusedDeclarationsName,
                        rules::MakeNoUnusedDeclarationsRule);
  registry.RegisterRule(rules::kNoDebugName, rules::MakeNoDebugRule);
  return registry;
}

const RuleRegistry &GlobalRuleRegistry() {
  static const RuleRegistry registry = MakeRuleRegistryWithDefaults();
  return registry;
}

} // namespace modlint

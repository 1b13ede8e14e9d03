#pragma once

#include <modlint/rule.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace modlint {

class RuleRegistry {
public:
  using RuleFactory = std::function<std::unique_ptr<Rule>()>;

  void RegisterRule(const std::string &name, RuleFactory factory,
                    bool enabled_by_default = true);

  std::unique_ptr<Rule> CreateRule(const std::string &name) const;
  // Empty `names` selects the rules enabled by default, in registration
  // order.
  std::vector<std::unique_ptr<Rule>>
  CreateRules(const std::vector<std::string> &names = {}) const;

  std::vector<std::string> RuleNames() const;
  const std::vector<std::string> &DefaultRuleNames() const {
    return default_names_;
  }
  bool Contains(const std::string &name) const {
    return factories_.count(name) != 0;
  }

private:
  std::string JoinNames() const;

  std::unordered_map<std::string, RuleFactory> factories_;
  std::vector<std::string> default_names_;
};

RuleRegistry MakeRuleRegistryWithDefaults();
const RuleRegistry &GlobalRuleRegistry();

} // namespace modlint

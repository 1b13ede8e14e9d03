#pragma once

#include <modlint/rule.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace modlint {

// Excludes modules whose path starts with one of the configured prefixes.
// Prefixes match whole path segments ("src/gen" excludes "src/gen/A.elm",
// not "src/generated/A.elm").
class PathPrefixTargetFilter : public RuleTargetFilter {
public:
  PathPrefixTargetFilter() = default;
  PathPrefixTargetFilter(
      std::vector<std::string> ignored_paths,
      std::map<std::string, std::vector<std::string>> rule_ignored_paths);

  void IgnoreForAllRules(const std::string &prefix);
  void IgnoreForRule(const std::string &rule_name, const std::string &prefix);

  bool Includes(const std::string &rule_name,
                const std::filesystem::path &path) const override;

private:
  std::vector<std::string> ignored_paths_;
  std::map<std::string, std::vector<std::string>> rule_ignored_paths_;
};

} // namespace modlint

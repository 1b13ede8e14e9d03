#include <modlint/rule_target_filter.h>

#include <algorithm>
#include <utility>

namespace modlint {
namespace {

std::string Normalize(const std::filesystem::path &path) {
  auto normalized = path.lexically_normal().generic_string();
  while (normalized.size() > 1 && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

bool HasPrefix(const std::string &path, const std::string &prefix) {
  if (prefix.empty() || path.rfind(prefix, 0) != 0) {
    return false;
  }
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

bool MatchesAny(const std::string &path,
                const std::vector<std::string> &prefixes) {
  return std::any_of(prefixes.begin(), prefixes.end(),
                     [&](const std::string &prefix) {
                       return HasPrefix(path, prefix);
                     });
}

} // namespace

PathPrefixTargetFilter::PathPrefixTargetFilter(
    std::vector<std::string> ignored_paths,
    std::map<std::string, std::vector<std::string>> rule_ignored_paths) {
  for (const auto &prefix : ignored_paths) {
    IgnoreForAllRules(prefix);
  }
  for (const auto &[rule_name, prefixes] : rule_ignored_paths) {
    for (const auto &prefix : prefixes) {
      IgnoreForRule(rule_name, prefix);
    }
  }
}

void PathPrefixTargetFilter::IgnoreForAllRules(const std::string &prefix) {
  ignored_paths_.push_back(Normalize(prefix));
}

void PathPrefixTargetFilter::IgnoreForRule(const std::string &rule_name,
                                           const std::string &prefix) {
  rule_ignored_paths_[rule_name].push_back(Normalize(prefix));
}

bool PathPrefixTargetFilter::Includes(const std::string &rule_name,
                                      const std::filesystem::path &path) const {
  const auto normalized = Normalize(path);
  if (MatchesAny(normalized, ignored_paths_)) {
    return false;
  }
  const auto rule = rule_ignored_paths_.find(rule_name);
  return rule == rule_ignored_paths_.end() ||
         !MatchesAny(normalized, rule->second);
}

} // namespace modlint

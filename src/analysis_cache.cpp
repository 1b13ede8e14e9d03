#include <modlint/analysis_cache.h>

#include <functional>
#include <utility>

namespace modlint {

Fingerprint FingerprintText(std::string_view text) {
  return std::hash<std::string_view>{}(text);
}

Fingerprint CombineFingerprints(Fingerprint seed, Fingerprint value) {
  return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

const ModuleCacheEntry *RuleCache::Lookup(const ModuleName &module,
                                          Fingerprint source_fingerprint,
                                          Fingerprint context_fingerprint) {
  const auto found = entries_.find(module);
  if (found == entries_.end()) {
    return nullptr;
  }
  if (found->second.source_fingerprint != source_fingerprint ||
      found->second.context_fingerprint != context_fingerprint) {
    entries_.erase(found);
    return nullptr;
  }
  return &found->second;
}

void RuleCache::Store(const ModuleName &module, ModuleCacheEntry entry) {
  entries_[module] = std::move(entry);
}

void RuleCache::Invalidate(const ModuleName &module) { entries_.erase(module); }

void RuleCache::RetainOnly(const std::set<ModuleName> &modules) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (modules.count(it->first) == 0) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

RuleCache AnalysisCache::ForRule(const std::string &rule_name) const {
  const auto found = rules_.find(rule_name);
  if (found == rules_.end()) {
    return RuleCache{};
  }
  return found->second;
}

void AnalysisCache::Put(const std::string &rule_name, RuleCache cache) {
  rules_[rule_name] = std::move(cache);
}

std::set<std::string> AnalysisCache::RuleNames() const {
  std::set<std::string> names;
  for (const auto &entry : rules_) {
    names.insert(entry.first);
  }
  return names;
}

} // namespace modlint

#pragma once

#include <modlint/diagnostic.h>
#include <modlint/syntax.h>

#include <any>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>

namespace modlint {

using Fingerprint = std::size_t;

Fingerprint FingerprintText(std::string_view text);
Fingerprint CombineFingerprints(Fingerprint seed, Fingerprint value);

struct ModuleCacheEntry {
  Fingerprint source_fingerprint = 0;
  Fingerprint context_fingerprint = 0;
  std::any contribution;
  Diagnostics diagnostics;
};

// Per-rule store of module results, keyed by module name and validated
// against the fingerprint of the module source and of its incoming context.
class RuleCache {
public:
  // Returns the entry when both fingerprints match. A stored entry whose
  // fingerprints differ is erased.
  const ModuleCacheEntry *Lookup(const ModuleName &module,
                                 Fingerprint source_fingerprint,
                                 Fingerprint context_fingerprint);
  void Store(const ModuleName &module, ModuleCacheEntry entry);
  void Invalidate(const ModuleName &module);
  // Drops entries of modules that are no longer part of the project.
  void RetainOnly(const std::set<ModuleName> &modules);

  bool Contains(const ModuleName &module) const {
    return entries_.count(module) != 0;
  }
  std::size_t Size() const { return entries_.size(); }

private:
  std::map<ModuleName, ModuleCacheEntry> entries_;
};

// Cache for every rule of one analysis configuration. Owned by a
// ValidProject and handed back to it after each run.
class AnalysisCache {
public:
  RuleCache ForRule(const std::string &rule_name) const;
  void Put(const std::string &rule_name, RuleCache cache);
  void Clear() { rules_.clear(); }

  bool Empty() const { return rules_.empty(); }
  std::set<std::string> RuleNames() const;

private:
  std::map<std::string, RuleCache> rules_;
};

} // namespace modlint

#include <modlint/project.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace modlint {

const ModuleName &Module::Name() const {
  if (!ast) {
    throw std::logic_error("Module " + path.string() + " was not parsed");
  }
  return ast->header.name;
}

std::vector<ModuleName> Module::ImportedModuleNames() const {
  if (!ast) {
    throw std::logic_error("Module " + path.string() + " was not parsed");
  }
  std::vector<ModuleName> names;
  std::set<ModuleName> seen;
  for (const auto &import : ast->imports) {
    if (seen.insert(import.module_name).second) {
      names.push_back(import.module_name);
    }
  }
  return names;
}

DependencySet FilterDirectDependencies(const DependencySet &all,
                                       const std::optional<Manifest> &manifest) {
  if (!manifest) {
    return all;
  }

  std::set<std::string> declared(manifest->dependencies.begin(),
                                 manifest->dependencies.end());
  declared.insert(manifest->test_dependencies.begin(),
                  manifest->test_dependencies.end());

  DependencySet direct;
  for (const auto &[name, dependency] : all) {
    if (declared.count(name) != 0) {
      direct.emplace(name, dependency);
    }
  }
  return direct;
}

bool IsUnderSourceDirectories(const std::filesystem::path &path,
                              const std::vector<std::string> &directories) {
  if (directories.empty()) {
    return true;
  }
  const auto normalized = path.lexically_normal().generic_string();
  return std::any_of(
      directories.begin(), directories.end(), [&](const std::string &dir) {
        auto prefix = std::filesystem::path(dir).lexically_normal()
                          .generic_string();
        if (!prefix.empty() && prefix.back() != '/') {
          prefix.push_back('/');
        }
        return normalized.rfind(prefix, 0) == 0;
      });
}

} // namespace modlint

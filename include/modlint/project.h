#pragma once

#include <modlint/syntax.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modlint {

// One source file. `ast` is empty when the parser collaborator failed on
// `source`. Modules are replaced wholesale on edits, never mutated.
struct Module {
  std::filesystem::path path;
  std::string source;
  std::optional<SyntaxFile> ast;
  bool is_in_source_directories = true;

  bool IsParsed() const { return ast.has_value(); }
  // Requires IsParsed().
  const ModuleName &Name() const;
  // Distinct imported module names in source order. Requires IsParsed().
  std::vector<ModuleName> ImportedModuleNames() const;
};

enum class ProjectKind { kApplication, kPackage };

// For an application `dependencies`/`test_dependencies` hold the direct and
// test-direct dependencies; for a package they hold deps and test-deps.
struct Manifest {
  std::filesystem::path path;
  ProjectKind kind = ProjectKind::kApplication;
  std::string name;
  std::vector<std::string> dependencies;
  std::vector<std::string> test_dependencies;
  std::vector<std::string> source_directories;
  std::string raw;
};

struct Readme {
  std::filesystem::path path;
  std::string content;
};

struct LibraryModuleApi {
  ModuleName name;
  std::vector<std::string> values;
  std::vector<std::string> types;
  std::vector<std::string> aliases;
  std::vector<std::string> operators;
};

struct Dependency {
  std::string name;
  std::string version;
  std::vector<LibraryModuleApi> modules;
};

using DependencySet = std::map<std::string, Dependency>;

// Keeps the entries of `all` whose name the manifest declares as direct or
// test dependency. Without a manifest every dependency is returned.
DependencySet FilterDirectDependencies(const DependencySet &all,
                                       const std::optional<Manifest> &manifest);

bool IsUnderSourceDirectories(const std::filesystem::path &path,
                              const std::vector<std::string> &directories);

} // namespace modlint

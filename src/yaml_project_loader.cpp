#include <modlint/yaml_project_loader.h>

#include <array>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace modlint {
namespace {

[[noreturn]] void ThrowMalformed(const std::string &where,
                                 const std::string &problem) {
  throw std::runtime_error("Invalid project snapshot at " + where + ": " +
                           problem);
}

std::string Child(const std::string &where, const std::string &key) {
  return where.empty() ? key : where + "." + key;
}

std::string Item(const std::string &where, std::size_t index) {
  return where + "[" + std::to_string(index) + "]";
}

std::string RequireString(const YAML::Node &node, const std::string &key,
                          const std::string &where) {
  const auto value = node[key];
  if (!value || !value.IsScalar()) {
    ThrowMalformed(Child(where, key), "expected a string");
  }
  return value.as<std::string>();
}

std::string OptionalString(const YAML::Node &node, const std::string &key,
                           const std::string &where) {
  const auto value = node[key];
  if (!value || value.IsNull()) {
    return {};
  }
  if (!value.IsScalar()) {
    ThrowMalformed(Child(where, key), "expected a string");
  }
  return value.as<std::string>();
}

bool OptionalBool(const YAML::Node &node, const std::string &key,
                  const std::string &where) {
  const auto value = node[key];
  if (!value) {
    return false;
  }
  if (!value.IsScalar()) {
    ThrowMalformed(Child(where, key), "expected a boolean");
  }
  return value.as<bool>();
}

std::vector<std::string> StringList(const YAML::Node &node,
                                    const std::string &key,
                                    const std::string &where) {
  std::vector<std::string> values;
  const auto list = node[key];
  if (!list || list.IsNull()) {
    return values;
  }
  if (!list.IsSequence()) {
    ThrowMalformed(Child(where, key), "expected a list of strings");
  }
  for (const auto &entry : list) {
    if (!entry.IsScalar()) {
      ThrowMalformed(Child(where, key), "expected a list of strings");
    }
    values.push_back(entry.as<std::string>());
  }
  return values;
}

ModuleName ParseModuleNameNode(const YAML::Node &node,
                               const std::string &where) {
  if (node.IsScalar()) {
    return SplitModuleName(node.as<std::string>());
  }
  if (node.IsSequence()) {
    ModuleName name;
    for (const auto &segment : node) {
      name.push_back(segment.as<std::string>());
    }
    return name;
  }
  ThrowMalformed(where, "expected a dotted module name or a list of segments");
}

// [start row, start column, end row, end column]
Range ParseRange(const YAML::Node &node, const std::string &key,
                 const std::string &where) {
  const auto value = node[key];
  if (!value) {
    return Range{};
  }
  if (!value.IsSequence() || value.size() != 4) {
    ThrowMalformed(Child(where, key), "expected four integers");
  }
  std::array<int, 4> numbers{};
  for (std::size_t i = 0; i < numbers.size(); ++i) {
    numbers[i] = value[i].as<int>();
  }
  return Range{{numbers[0], numbers[1]}, {numbers[2], numbers[3]}};
}

ExpressionKind ParseExpressionKind(const std::string &name,
                                   const std::string &where) {
  static const std::vector<ExpressionKind> kinds = {
      ExpressionKind::kReference,     ExpressionKind::kOperatorReference,
      ExpressionKind::kLiteral,       ExpressionKind::kApplication,
      ExpressionKind::kOperatorApplication,
      ExpressionKind::kLambda,        ExpressionKind::kLet,
      ExpressionKind::kIf,            ExpressionKind::kCase,
      ExpressionKind::kRecord,        ExpressionKind::kRecordAccess,
      ExpressionKind::kList,          ExpressionKind::kTuple,
      ExpressionKind::kParenthesized, ExpressionKind::kOther};
  for (const auto kind : kinds) {
    if (name == ExpressionKindName(kind)) {
      return kind;
    }
  }
  ThrowMalformed(where, "unknown expression kind '" + name + "'");
}

DeclarationKind ParseDeclarationKind(const std::string &name,
                                     const std::string &where) {
  static const std::vector<DeclarationKind> kinds = {
      DeclarationKind::kFunction,      DeclarationKind::kTypeAlias,
      DeclarationKind::kCustomType,    DeclarationKind::kPort,
      DeclarationKind::kInfixOperator, DeclarationKind::kDestructuring};
  for (const auto kind : kinds) {
    if (name == DeclarationKindName(kind)) {
      return kind;
    }
  }
  ThrowMalformed(where, "unknown declaration kind '" + name + "'");
}

ModuleKind ParseModuleKind(const std::string &name, const std::string &where) {
  if (name.empty() || name == "normal") {
    return ModuleKind::kNormal;
  }
  if (name == "port") {
    return ModuleKind::kPort;
  }
  if (name == "effect") {
    return ModuleKind::kEffect;
  }
  ThrowMalformed(where, "unknown module kind '" + name + "'");
}

Expression ParseExpression(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected an expression mapping");
  }
  Expression expression;
  expression.kind =
      ParseExpressionKind(RequireString(node, "kind", where), where);
  if (const auto qualifier = node["qualifier"]; qualifier && !qualifier.IsNull()) {
    expression.qualifier =
        ParseModuleNameNode(qualifier, Child(where, "qualifier"));
  }
  expression.name = OptionalString(node, "name", where);
  expression.range = ParseRange(node, "range", where);
  if (const auto children = node["children"]; children) {
    if (!children.IsSequence()) {
      ThrowMalformed(Child(where, "children"), "expected a list");
    }
    for (std::size_t i = 0; i < children.size(); ++i) {
      expression.children.push_back(
          ParseExpression(children[i], Item(Child(where, "children"), i)));
    }
  }
  return expression;
}

TypeReference ParseTypeReference(const YAML::Node &node,
                                 const std::string &where) {
  if (node.IsScalar()) {
    const auto dotted = node.as<std::string>();
    const auto dot = dotted.rfind('.');
    if (dot == std::string::npos) {
      return TypeReference{{}, dotted, Range{}};
    }
    return TypeReference{SplitModuleName(dotted.substr(0, dot)),
                         dotted.substr(dot + 1), Range{}};
  }
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected a type name or a type mapping");
  }
  TypeReference reference;
  if (const auto qualifier = node["qualifier"]; qualifier && !qualifier.IsNull()) {
    reference.qualifier =
        ParseModuleNameNode(qualifier, Child(where, "qualifier"));
  }
  reference.name = RequireString(node, "name", where);
  reference.range = ParseRange(node, "range", where);
  return reference;
}

Declaration ParseDeclaration(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected a declaration mapping");
  }
  Declaration declaration;
  declaration.kind =
      ParseDeclarationKind(RequireString(node, "kind", where), where);
  declaration.name = OptionalString(node, "name", where);
  declaration.range = ParseRange(node, "range", where);
  declaration.name_range = node["name_range"]
                               ? ParseRange(node, "name_range", where)
                               : declaration.range;
  if (const auto body = node["body"]; body && !body.IsNull()) {
    declaration.body = ParseExpression(body, Child(where, "body"));
  }
  if (const auto types = node["types"]; types && !types.IsNull()) {
    if (!types.IsSequence()) {
      ThrowMalformed(Child(where, "types"), "expected a list");
    }
    for (std::size_t i = 0; i < types.size(); ++i) {
      declaration.type_references.push_back(
          ParseTypeReference(types[i], Item(Child(where, "types"), i)));
    }
  }
  return declaration;
}

Import ParseImport(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap() || !node["module"]) {
    ThrowMalformed(where, "expected an import with a 'module' entry");
  }
  Import import;
  import.module_name = ParseModuleNameNode(node["module"], Child(where, "module"));
  const auto alias = OptionalString(node, "alias", where);
  if (!alias.empty()) {
    import.alias = alias;
  }
  import.exposing_all = OptionalBool(node, "exposing_all", where);
  import.exposed = StringList(node, "exposing", where);
  import.range = ParseRange(node, "range", where);
  return import;
}

SyntaxFile ParseSyntaxFile(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected a syntax tree mapping");
  }
  SyntaxFile file;
  const auto header = node["header"];
  if (!header || !header.IsMap() || !header["name"]) {
    ThrowMalformed(Child(where, "header"), "expected a module header");
  }
  const auto header_where = Child(where, "header");
  file.header.kind = ParseModuleKind(
      OptionalString(header, "kind", header_where), header_where);
  file.header.name =
      ParseModuleNameNode(header["name"], Child(header_where, "name"));
  file.header.exposing_all = OptionalBool(header, "exposing_all", header_where);
  file.header.exposed = StringList(header, "exposing", header_where);
  file.header.range = ParseRange(header, "range", header_where);

  const auto sequence = [&](const std::string &key) {
    const auto list = node[key];
    if (list && !list.IsNull() && !list.IsSequence()) {
      ThrowMalformed(Child(where, key), "expected a list");
    }
    return list;
  };

  if (const auto imports = sequence("imports")) {
    for (std::size_t i = 0; i < imports.size(); ++i) {
      file.imports.push_back(
          ParseImport(imports[i], Item(Child(where, "imports"), i)));
    }
  }
  if (const auto declarations = sequence("declarations")) {
    for (std::size_t i = 0; i < declarations.size(); ++i) {
      file.declarations.push_back(ParseDeclaration(
          declarations[i], Item(Child(where, "declarations"), i)));
    }
  }
  if (const auto comments = sequence("comments")) {
    for (std::size_t i = 0; i < comments.size(); ++i) {
      const auto comment_where = Item(Child(where, "comments"), i);
      file.comments.push_back(
          Comment{RequireString(comments[i], "text", comment_where),
                  ParseRange(comments[i], "range", comment_where)});
    }
  }
  return file;
}

Module ParseModule(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected a module mapping");
  }
  Module module;
  module.path = RequireString(node, "path", where);
  module.source = OptionalString(node, "source", where);
  if (node["parse_error"] && !node["parse_error"].IsNull()) {
    return module;
  }
  if (!node["ast"]) {
    ThrowMalformed(where, "module needs either 'ast' or 'parse_error'");
  }
  module.ast = ParseSyntaxFile(node["ast"], Child(where, "ast"));
  return module;
}

Manifest ParseManifest(const YAML::Node &node) {
  const std::string where = "manifest";
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected a mapping");
  }
  Manifest manifest;
  manifest.path = OptionalString(node, "path", where);
  if (manifest.path.empty()) {
    manifest.path = "elm.json";
  }
  const auto kind = OptionalString(node, "kind", where);
  if (kind.empty() || kind == "application") {
    manifest.kind = ProjectKind::kApplication;
  } else if (kind == "package") {
    manifest.kind = ProjectKind::kPackage;
  } else {
    ThrowMalformed(Child(where, "kind"), "unknown project kind '" + kind + "'");
  }
  manifest.name = OptionalString(node, "name", where);
  manifest.dependencies = StringList(node, "dependencies", where);
  manifest.test_dependencies = StringList(node, "test_dependencies", where);
  manifest.source_directories = StringList(node, "source_directories", where);
  manifest.raw = OptionalString(node, "raw", where);
  if (manifest.raw.empty()) {
    manifest.raw = YAML::Dump(node);
  }
  return manifest;
}

Dependency ParseDependency(const YAML::Node &node, const std::string &where) {
  if (!node.IsMap()) {
    ThrowMalformed(where, "expected a dependency mapping");
  }
  Dependency dependency;
  dependency.name = RequireString(node, "name", where);
  dependency.version = OptionalString(node, "version", where);
  if (const auto modules = node["modules"]; modules) {
    for (std::size_t i = 0; i < modules.size(); ++i) {
      const auto module_where = Item(Child(where, "modules"), i);
      const auto &entry = modules[i];
      if (!entry.IsMap() || !entry["name"]) {
        ThrowMalformed(module_where, "expected a module API with a name");
      }
      LibraryModuleApi api;
      api.name = ParseModuleNameNode(entry["name"], Child(module_where, "name"));
      api.values = StringList(entry, "values", module_where);
      api.types = StringList(entry, "types", module_where);
      api.aliases = StringList(entry, "aliases", module_where);
      api.operators = StringList(entry, "operators", module_where);
      dependency.modules.push_back(std::move(api));
    }
  }
  return dependency;
}

ProjectInputs ParseSnapshotRoot(const YAML::Node &root) {
  if (!root.IsMap()) {
    ThrowMalformed("<root>", "expected a mapping");
  }
  ProjectInputs inputs;
  if (const auto modules = root["modules"]; modules && !modules.IsNull()) {
    if (!modules.IsSequence()) {
      ThrowMalformed("modules", "expected a list");
    }
    for (std::size_t i = 0; i < modules.size(); ++i) {
      inputs.modules.push_back(ParseModule(modules[i], Item("modules", i)));
    }
  }
  if (const auto manifest = root["manifest"]; manifest && !manifest.IsNull()) {
    inputs.manifest = ParseManifest(manifest);
  }
  if (const auto readme = root["readme"]; readme && !readme.IsNull()) {
    inputs.readme = Readme{OptionalString(readme, "path", "readme"),
                           OptionalString(readme, "content", "readme")};
    if (inputs.readme->path.empty()) {
      inputs.readme->path = "README.md";
    }
  }
  if (const auto dependencies = root["dependencies"];
      dependencies && !dependencies.IsNull()) {
    for (std::size_t i = 0; i < dependencies.size(); ++i) {
      auto dependency =
          ParseDependency(dependencies[i], Item("dependencies", i));
      auto name = dependency.name;
      inputs.dependencies.emplace(std::move(name), std::move(dependency));
    }
  }
  MarkSourceDirectories(inputs, {});
  return inputs;
}

} // namespace

void MarkSourceDirectories(ProjectInputs &inputs,
                           const std::vector<std::string> &directories) {
  const auto &effective =
      !directories.empty() || !inputs.manifest
          ? directories
          : inputs.manifest->source_directories;
  for (auto &module : inputs.modules) {
    module.is_in_source_directories =
        IsUnderSourceDirectories(module.path, effective);
  }
}

ProjectInputs ParseProjectSnapshot(const std::string &yaml_text) {
  try {
    return ParseSnapshotRoot(YAML::Load(yaml_text));
  } catch (const YAML::Exception &ex) {
    throw std::runtime_error(std::string("Invalid project snapshot: ") +
                             ex.what());
  }
}

ProjectInputs LoadProjectSnapshotFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Project snapshot not found: " + path.string());
  }
  try {
    return ParseSnapshotRoot(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception &ex) {
    throw std::runtime_error("Invalid project snapshot " + path.string() +
                             ": " + ex.what());
  }
}

YamlProjectLoader::YamlProjectLoader(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

ProjectInputs YamlProjectLoader::Load(const AnalysisConfig &config) {
  if (config.project_path.empty()) {
    throw std::invalid_argument("A project snapshot path is required");
  }
  auto inputs = LoadProjectSnapshotFile(config.project_path);
  if (!config.source_directories.empty()) {
    MarkSourceDirectories(inputs, config.source_directories);
  }
  logger_->Log(LogLevel::kInfo, "project.loaded",
               {{"path", config.project_path},
                {"modules", std::to_string(inputs.modules.size())},
                {"dependencies", std::to_string(inputs.dependencies.size())}});
  return inputs;
}

} // namespace modlint

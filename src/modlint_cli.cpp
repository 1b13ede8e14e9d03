#include <modlint/analysis_pipeline_builder.h>
#include <modlint/cli_exit_codes.h>
#include <modlint/default_analysis_pipeline.h>
#include <modlint/modlint_cli.h>
#include <modlint/rule_registry.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using modlint::AnalyzeOptions;

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: modlint analyze --project <snapshot.yml> [options]\n"
      << "Options:\n"
      << "  --project <file>      YAML snapshot of the parsed project\n"
      << "  --config <file>       Optional YAML config file\n"
      << "  --rules <list>        Comma-separated rule names (default: all\n"
      << "                        rules enabled by default)\n"
      << "  --format <list>       Comma-separated output formats\n"
      << "                        (supported: text,json)\n"
      << "  --out <file>          Write the report to a file instead of\n"
      << "                        standard output\n"
      << "  --workers <n>         Worker tasks for unordered rules\n"
      << "  --no-cache            Disable the incremental cache\n"
      << "  --source-directories <list>  Comma-separated source roots\n"
      << "  --ignored-paths <list> Comma-separated path prefixes no rule\n"
      << "                        visits\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

std::size_t ParseWorkers(const std::string &value) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw std::invalid_argument("Worker count must be a positive integer: " +
                                value);
  }
  const auto workers = std::stoul(trimmed);
  if (workers == 0) {
    throw std::invalid_argument("Worker count must be a positive integer: " +
                                value);
  }
  return workers;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendValues(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    value = Trim(value);
    if (value.empty()) {
      continue;
    }
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(Trim(format));
    if (format != "text" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

void AppendPaths(const std::string &raw_paths,
                 std::vector<std::string> &target) {
  for (auto path_value : SplitList(raw_paths)) {
    path_value = Trim(path_value);
    if (path_value.empty()) {
      continue;
    }
    const auto normalized = std::filesystem::path(path_value).generic_string();
    if (std::find(target.begin(), target.end(), normalized) == target.end()) {
      target.push_back(normalized);
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        modlint::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = modlint::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = modlint::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleListOption(const std::vector<std::string> &arguments,
                      std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--rules") {
    AppendValues(RequireValue(arguments, index, argument), options.rules);
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  if (argument == "--source-directories") {
    AppendPaths(RequireValue(arguments, index, argument),
                options.source_directories);
    return true;
  }
  if (argument == "--ignored-paths") {
    AppendPaths(RequireValue(arguments, index, argument),
                options.ignored_paths);
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--project") {
    options.project = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--workers") {
    options.workers = ParseWorkers(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--no-cache") {
    options.use_cache = false;
    return true;
  }
  return HandleListOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options);
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.project) {
    throw std::invalid_argument(
        "--project is required (or set in config file)");
  }
}

void WriteFile(const std::filesystem::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

// With both formats selected the JSON report goes next to the text one.
void WriteReport(const AnalyzeOptions &options, const modlint::Report &report) {
  if (!options.output_file) {
    std::cout << report.text;
    if (!report.json.empty()) {
      std::cout << report.json << "\n";
    }
    return;
  }
  if (report.text.empty()) {
    WriteFile(*options.output_file, report.json);
    return;
  }
  WriteFile(*options.output_file, report.text);
  if (!report.json.empty()) {
    auto json_path = *options.output_file;
    json_path.replace_extension(".json");
    WriteFile(json_path, report.json);
  }
}

using ConfigValue =
    std::variant<std::string, bool, std::vector<std::string>,
                 std::map<std::string, std::vector<std::string>>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

std::map<std::string, std::vector<std::string>>
ExtractRuleIgnoredPaths(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must map rule names to path lists");
  }
  std::map<std::string, std::vector<std::string>> paths;
  for (const auto &entry : node) {
    const auto rule = entry.first.as<std::string>();
    paths[rule] = ExtractList(entry.second, key_name + "." + rule, AppendPaths);
  }
  return paths;
}

} // namespace

namespace modlint {

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"project",
                                                "rules",
                                                "log_level",
                                                "cache",
                                                "workers",
                                                "source_directories",
                                                "ignored_paths",
                                                "rule_ignored_paths",
                                                "format",
                                                "out"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"snapshot", "project"},
      {"formats", "format"},
      {"output", "out"},
      {"output_file", "out"},
      {"use_cache", "cache"},
      {"worker_count", "workers"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

namespace {

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "rules") {
    return ExtractList(node, key, AppendValues);
  }
  if (key == "format") {
    return ExtractList(node, key, AppendFormats);
  }
  if (key == "source_directories" || key == "ignored_paths") {
    return ExtractList(node, key, AppendPaths);
  }
  if (key == "rule_ignored_paths") {
    return ExtractRuleIgnoredPaths(node, key);
  }
  if (key == "cache") {
    return ConfigValue{ExtractBool(node, key)};
  }
  if (key == "project" || key == "out" || key == "log_level" ||
      key == "workers") {
    return ConfigValue{ExtractStringScalar(node, key)};
  }
  ThrowUnknownKey(key);
}

RawConfig ParseYamlConfig(const YAML::Node &root) {
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }
  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, AnalyzeOptions &options) {
  using StringList = std::vector<std::string>;
  for (const auto &[key, value] : config) {
    if (key == "project") {
      options.project = std::get<std::string>(value);
    } else if (key == "out") {
      options.output_file = std::get<std::string>(value);
    } else if (key == "rules") {
      options.rules = std::get<StringList>(value);
    } else if (key == "format") {
      options.formats = std::get<StringList>(value);
    } else if (key == "source_directories") {
      options.source_directories = std::get<StringList>(value);
    } else if (key == "ignored_paths") {
      options.ignored_paths = std::get<StringList>(value);
    } else if (key == "rule_ignored_paths") {
      options.rule_ignored_paths =
          std::get<std::map<std::string, StringList>>(value);
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(std::get<std::string>(value));
    } else if (key == "cache") {
      options.use_cache = std::get<bool>(value);
    } else if (key == "workers") {
      options.workers = ParseWorkers(std::get<std::string>(value));
    } else {
      ThrowUnknownKey(key);
    }
  }
}

} // namespace

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

AnalyzeOptions ParseConfigText(const std::string &yaml_text) {
  AnalyzeOptions options;
  ApplyConfig(ParseYamlConfig(YAML::Load(yaml_text)), options);
  return options;
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  AnalyzeOptions options;
  ApplyConfig(ParseYamlConfig(YAML::LoadFile(path.string())), options);
  options.config_file = path;
  // A relative snapshot path is resolved against the config file.
  if (options.project && options.project->is_relative()) {
    options.project = path.parent_path() / *options.project;
  }
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.project, cli_options.project);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.output_file, cli_options.output_file);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.use_cache, cli_options.use_cache);
  override_value(merged.workers, cli_options.workers);
  override_list(merged.rules, cli_options.rules);
  override_list(merged.formats, cli_options.formats);
  override_list(merged.source_directories, cli_options.source_directories);
  override_list(merged.ignored_paths, cli_options.ignored_paths);
  override_list(merged.rule_ignored_paths, cli_options.rule_ignored_paths);
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options) {
  AnalysisConfig config;
  config.project_path = options.project ? options.project->string() : "";
  config.formats = options.formats.empty() ? std::vector<std::string>{"text"}
                                           : options.formats;
  config.use_cache = options.use_cache.value_or(true);
  config.worker_count = options.workers.value_or(1);
  config.source_directories = options.source_directories;
  config.ignored_paths = options.ignored_paths;
  config.rule_ignored_paths = options.rule_ignored_paths;
  config.logging.level = options.log_level.value_or(LogLevel::kWarn);
  return config;
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage();
    return 0;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  auto config = BuildAnalysisConfig(merged);
  auto logger = MakeLogger(config.logging, std::clog);
  config.logger = logger;

  AnalysisPipelineBuilder builder;
  builder.WithLogger(logger).WithRuleNames(merged.rules);
  auto pipeline = builder.Build();

  const auto result = pipeline.Run(config);
  WriteReport(merged, result.report);
  return ReviewExitCode(result.outcome);
}

int RunListRules(const std::vector<std::string> &arguments) {
  if (!arguments.empty()) {
    if (arguments.front() == "--help" || arguments.front() == "-h") {
      std::cout << "Usage: modlint rules\n"
                << "Lists the registered rules; '*' marks the rules enabled "
                   "by default.\n";
      return 0;
    }
    throw std::invalid_argument("Unknown rules argument: " + arguments.front());
  }
  const auto &registry = GlobalRuleRegistry();
  const auto &defaults = registry.DefaultRuleNames();
  for (const auto &name : registry.RuleNames()) {
    const bool enabled =
        std::find(defaults.begin(), defaults.end(), name) != defaults.end();
    const auto rule = registry.CreateRule(name);
    std::cout << (enabled ? "* " : "  ") << name << " ("
              << TraversalModeName(rule->Mode()) << ")\n";
  }
  return 0;
}

} // namespace modlint

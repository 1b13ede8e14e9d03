#pragma once

#include <modlint/logging.h>
#include <modlint/models.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modlint {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> project;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> output_file;
  std::vector<std::string> rules;
  std::vector<std::string> formats;
  std::vector<std::string> source_directories;
  std::vector<std::string> ignored_paths;
  std::map<std::string, std::vector<std::string>> rule_ignored_paths;
  std::optional<LogLevel> log_level;
  std::optional<bool> use_cache;
  std::optional<std::size_t> workers;
  bool show_help = false;
};

const std::vector<std::string> &SupportedConfigKeys();
std::string NormalizeConfigKey(std::string key);

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions ParseConfigText(const std::string &yaml_text);
// Values given on the command line win over those of the config file.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options);

int RunAnalyze(const std::vector<std::string> &arguments);
int RunListRules(const std::vector<std::string> &arguments);

} // namespace modlint

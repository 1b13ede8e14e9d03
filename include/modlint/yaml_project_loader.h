#pragma once

#include <modlint/interfaces.h>

#include <filesystem>
#include <memory>
#include <string>

namespace modlint {

// Reads a YAML snapshot of an already parsed project: modules with their
// syntax trees, an optional manifest and readme, and the API tables of the
// installed dependencies. A module with a `parse_error` entry is loaded
// without a syntax tree.
class YamlProjectLoader : public ProjectLoader {
public:
  explicit YamlProjectLoader(std::shared_ptr<Logger> logger = nullptr);

  ProjectInputs Load(const AnalysisConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

ProjectInputs ParseProjectSnapshot(const std::string &yaml_text);
ProjectInputs LoadProjectSnapshotFile(const std::filesystem::path &path);

// Recomputes Module::is_in_source_directories. An empty `directories` falls
// back to those of the manifest.
void MarkSourceDirectories(ProjectInputs &inputs,
                           const std::vector<std::string> &directories);

} // namespace modlint

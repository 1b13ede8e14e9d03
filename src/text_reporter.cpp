#include <modlint/text_reporter.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace modlint {
namespace {

constexpr const char kProjectValidationRule[] = "ProjectValidation";
constexpr const char kGlobalGroup[] = "(project)";

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  return Join(values, ",", [](const std::string &value) {
    return "\"" + EscapeJsonString(value) + "\"";
  });
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "text";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

const char *LocationName(DiagnosticLocation location) {
  switch (location) {
  case DiagnosticLocation::kModule:
    return "module";
  case DiagnosticLocation::kManifest:
    return "manifest";
  case DiagnosticLocation::kReadme:
    return "readme";
  case DiagnosticLocation::kGlobal:
    return "global";
  }
  return "global";
}

std::string GroupName(const Diagnostic &diagnostic) {
  if (diagnostic.location == DiagnosticLocation::kGlobal ||
      diagnostic.file_path.empty()) {
    return kGlobalGroup;
  }
  return diagnostic.file_path.generic_string();
}

std::string FormatPosition(const Position &position) {
  return std::to_string(position.row) + ":" + std::to_string(position.column);
}

std::vector<std::string> PathStrings(
    const std::vector<std::filesystem::path> &paths) {
  std::vector<std::string> values;
  values.reserve(paths.size());
  for (const auto &path : paths) {
    values.push_back(path.generic_string());
  }
  return values;
}

Diagnostics CollectDiagnostics(const ReviewOutcome &outcome) {
  Diagnostics diagnostics;
  if (outcome.project_error) {
    diagnostics.push_back(DiagnosticForProjectError(*outcome.project_error));
  }
  diagnostics.insert(diagnostics.end(), outcome.diagnostics.begin(),
                     outcome.diagnostics.end());
  return diagnostics;
}

// Global diagnostics first, then files in path order. Inside a group the
// incoming order is kept.
std::map<std::string, Diagnostics> GroupByFile(const Diagnostics &diagnostics) {
  std::map<std::string, Diagnostics> groups;
  for (const auto &diagnostic : diagnostics) {
    groups[GroupName(diagnostic)].push_back(diagnostic);
  }
  return groups;
}

std::vector<std::pair<std::string, Diagnostics>>
OrderedGroups(const Diagnostics &diagnostics) {
  auto groups = GroupByFile(diagnostics);
  std::vector<std::pair<std::string, Diagnostics>> ordered;
  if (const auto global = groups.find(kGlobalGroup); global != groups.end()) {
    ordered.emplace_back(global->first, std::move(global->second));
    groups.erase(global);
  }
  for (auto &group : groups) {
    ordered.emplace_back(group.first, std::move(group.second));
  }
  return ordered;
}

std::string BuildText(const Diagnostics &diagnostics) {
  if (diagnostics.empty()) {
    return "No diagnostics.\n";
  }
  const auto groups = OrderedGroups(diagnostics);
  std::ostringstream output;
  std::size_t files = 0;
  for (const auto &[name, group] : groups) {
    if (name != kGlobalGroup) {
      ++files;
    }
    output << name << "\n";
    for (const auto &diagnostic : group) {
      output << "  ";
      if (diagnostic.location != DiagnosticLocation::kGlobal) {
        output << FormatPosition(diagnostic.range.start) << "-"
               << FormatPosition(diagnostic.range.end) << "  ";
      }
      output << "[" << diagnostic.rule_name << "] " << diagnostic.message
             << "\n";
      for (const auto &detail : diagnostic.details) {
        output << "      " << detail << "\n";
      }
    }
    output << "\n";
  }
  output << diagnostics.size()
         << (diagnostics.size() == 1 ? " diagnostic" : " diagnostics")
         << " in " << files << (files == 1 ? " file" : " files") << "\n";
  return output.str();
}

std::string BuildDiagnosticJson(const Diagnostic &diagnostic) {
  std::ostringstream json;
  json << "{\"rule\": \"" << EscapeJsonString(diagnostic.rule_name) << "\",";
  json << "\"message\": \"" << EscapeJsonString(diagnostic.message) << "\",";
  json << "\"details\": [" << JoinJsonArray(diagnostic.details) << "],";
  json << "\"location\": \"" << LocationName(diagnostic.location) << "\",";
  json << "\"file\": \""
       << EscapeJsonString(diagnostic.file_path.generic_string()) << "\",";
  json << "\"module\": ";
  if (diagnostic.module_name) {
    json << "\"" << EscapeJsonString(JoinModuleName(*diagnostic.module_name))
         << "\",";
  } else {
    json << "null,";
  }
  json << "\"range\": {\"start\": {\"row\": " << diagnostic.range.start.row
       << ", \"column\": " << diagnostic.range.start.column << "},";
  json << "\"end\": {\"row\": " << diagnostic.range.end.row
       << ", \"column\": " << diagnostic.range.end.column << "}}}";
  return json.str();
}

std::string BuildJson(const ReviewOutcome &outcome,
                      const Diagnostics &diagnostics) {
  std::ostringstream json;
  json << "{\"diagnostics\": [";
  json << Join(diagnostics, ",", BuildDiagnosticJson);
  json << "],";
  json << "\"project_error\": ";
  if (outcome.project_error) {
    json << "\"" << EscapeJsonString(DescribeError(*outcome.project_error))
         << "\",";
  } else {
    json << "null,";
  }
  json << "\"cache\": {";
  json << Join(outcome.cache_statistics, ",", [](const auto &entry) {
    return "\"" + EscapeJsonString(entry.first) +
           "\": {\"reused\": " + std::to_string(entry.second.reused.size()) +
           ", \"recomputed\": " +
           std::to_string(entry.second.recomputed.size()) + "}";
  });
  json << "},";
  json << "\"summary\": {\"diagnostics\": " << diagnostics.size() << "}}";
  return json.str();
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

Diagnostic DiagnosticForProjectError(const InvalidProjectError &error) {
  std::vector<std::string> details = std::visit(
      [](const auto &value) -> std::vector<std::string> {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, NoModules>) {
          return {};
        } else {
          return PathStrings(value.paths);
        }
      },
      error);
  auto diagnostic = MakeGlobalError(DescribeError(error), std::move(details));
  diagnostic.rule_name = kProjectValidationRule;
  return diagnostic;
}

Report TextReporter::Render(const ReviewOutcome &outcome,
                            const AnalysisConfig &config) {
  const auto diagnostics = CollectDiagnostics(outcome);
  Report report;
  if (ShouldRenderFormat(config.formats, "text")) {
    report.text = BuildText(diagnostics);
  }
  if (ShouldRenderFormat(config.formats, "json")) {
    report.json = BuildJson(outcome, diagnostics);
  }
  return report;
}

} // namespace modlint

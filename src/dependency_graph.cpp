#include <modlint/dependency_graph.h>

#include <algorithm>
#include <cstdint>

namespace modlint {
namespace {

enum class Mark : std::uint8_t { kNone, kVisiting, kDone };

class DepthFirstSorter {
public:
  explicit DepthFirstSorter(const DependencyGraph &graph)
      : graph_(graph), marks_(graph.NodeCount(), Mark::kNone) {}

  TopologicalSort Run() {
    for (DependencyGraph::NodeId node = 0; node < graph_.NodeCount(); ++node) {
      if (marks_[node] == Mark::kNone && !Visit(node)) {
        result_.order.clear();
        return std::move(result_);
      }
    }
    return std::move(result_);
  }

private:
  bool Visit(DependencyGraph::NodeId node) {
    marks_[node] = Mark::kVisiting;
    stack_.push_back(node);
    for (const auto imported : graph_.ImportsOf(node)) {
      if (marks_[imported] == Mark::kVisiting) {
        const auto start = std::find(stack_.begin(), stack_.end(), imported);
        result_.cycle.assign(start, stack_.end());
        return false;
      }
      if (marks_[imported] == Mark::kNone && !Visit(imported)) {
        return false;
      }
    }
    stack_.pop_back();
    marks_[node] = Mark::kDone;
    result_.order.push_back(node);
    return true;
  }

  const DependencyGraph &graph_;
  std::vector<Mark> marks_;
  std::vector<DependencyGraph::NodeId> stack_;
  TopologicalSort result_;
};

} // namespace

DependencyGraph::NodeId DependencyGraph::AddNode(const ModuleName &name) {
  const auto found = index_.find(name);
  if (found != index_.end()) {
    return found->second;
  }
  const auto id = names_.size();
  names_.push_back(name);
  edges_.emplace_back();
  index_.emplace(name, id);
  return id;
}

void DependencyGraph::AddEdge(NodeId importer, NodeId imported) {
  auto &targets = edges_.at(importer);
  if (std::find(targets.begin(), targets.end(), imported) == targets.end()) {
    targets.push_back(imported);
  }
}

std::optional<DependencyGraph::NodeId>
DependencyGraph::Find(const ModuleName &name) const {
  const auto found = index_.find(name);
  if (found == index_.end()) {
    return std::nullopt;
  }
  return found->second;
}

bool DependencyGraph::HasEdge(NodeId importer, NodeId imported) const {
  const auto &targets = edges_.at(importer);
  return std::find(targets.begin(), targets.end(), imported) != targets.end();
}

std::size_t DependencyGraph::EdgeCount() const {
  std::size_t count = 0;
  for (const auto &targets : edges_) {
    count += targets.size();
  }
  return count;
}

DependencyGraph
BuildDependencyGraph(const std::vector<std::shared_ptr<const Module>> &modules) {
  DependencyGraph graph;
  for (const auto &module : modules) {
    graph.AddNode(module->Name());
  }
  for (const auto &module : modules) {
    const auto importer = *graph.Find(module->Name());
    for (const auto &imported_name : module->ImportedModuleNames()) {
      if (const auto imported = graph.Find(imported_name)) {
        graph.AddEdge(importer, *imported);
      }
    }
  }
  return graph;
}

TopologicalSort SortTopologically(const DependencyGraph &graph) {
  return DepthFirstSorter(graph).Run();
}

} // namespace modlint

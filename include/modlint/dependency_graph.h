#pragma once

#include <modlint/project.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace modlint {

// Directed import graph keyed by module name. An edge goes from the
// importing module to the imported one. Nodes are dense indices into an
// adjacency list, assigned in insertion order.
class DependencyGraph {
public:
  using NodeId = std::size_t;

  NodeId AddNode(const ModuleName &name);
  void AddEdge(NodeId importer, NodeId imported);

  std::optional<NodeId> Find(const ModuleName &name) const;
  const ModuleName &NameOf(NodeId node) const { return names_.at(node); }
  const std::vector<NodeId> &ImportsOf(NodeId node) const {
    return edges_.at(node);
  }
  bool HasEdge(NodeId importer, NodeId imported) const;

  std::size_t NodeCount() const { return names_.size(); }
  std::size_t EdgeCount() const;

private:
  std::vector<ModuleName> names_;
  std::vector<std::vector<NodeId>> edges_;
  std::map<ModuleName, NodeId> index_;
};

// One node per module (in input order), one edge per import of another
// module of the set. Imports of modules outside the set are ignored.
// Requires every module to be parsed.
DependencyGraph
BuildDependencyGraph(const std::vector<std::shared_ptr<const Module>> &modules);

struct TopologicalSort {
  // Imported modules come before their importers. Empty when `cycle` is set.
  std::vector<DependencyGraph::NodeId> order;
  // The cycle closed by the first back edge of the depth-first search, in
  // traversal order: each node imports the next, the last imports the first.
  std::vector<DependencyGraph::NodeId> cycle;

  bool HasCycle() const { return !cycle.empty(); }
};

TopologicalSort SortTopologically(const DependencyGraph &graph);

} // namespace modlint

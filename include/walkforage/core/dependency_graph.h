#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace walkforage {

using IdSet = std::unordered_set<std::string>;

struct DependencyNode {
  std::string id;
  std::vector<std::string> prereqs;
};

// Outcome of DependencyGraph::validate_acyclic().
struct AcyclicCheck {
  // Ids that sit on at least one cycle, in declaration order.
  std::vector<std::string> offending;

  // Each detected cycle as a closed path (first id repeated at the end).
  std::vector<std::vector<std::string>> cycles;

  bool ok() const { return offending.empty(); }
};

// Static prerequisite structure over a fixed, ordered node list.
//
// The node list is the source of truth for ordering: every listing query
// returns ids in declaration order so UI listings and tests are stable.
// Prerequisite ids that do not name a node ("dangling" ids) are tolerated;
// they can never be satisfied by a node of this graph and are reported by
// content validation instead.
//
// The graph is immutable after construction and safe to share.
class DependencyGraph {
 public:
  DependencyGraph() = default;

  // Duplicate ids keep the first definition.
  explicit DependencyGraph(std::vector<DependencyNode> nodes);

  const std::vector<DependencyNode>& nodes() const { return nodes_; }
  std::size_t size() const { return nodes_.size(); }

  const DependencyNode* find(const std::string& id) const;
  bool contains(const std::string& id) const { return find(id) != nullptr; }

  // True iff `id` is not in `satisfied` and all its direct prereqs are.
  // std::nullopt for an unknown id.
  std::optional<bool> is_available(const std::string& id, const IdSet& satisfied) const;

  // All available ids, declaration order.
  std::vector<std::string> available_set(const IdSet& satisfied) const;

  // Direct prereqs of `id` not in `satisfied`, in the node's prereq order.
  std::vector<std::string> missing_prerequisites(const std::string& id, const IdSet& satisfied) const;

  // Every direct and indirect prereq of `id`, breadth-first, each listed once.
  // Empty for a root or an unknown id.
  std::vector<std::string> transitive_closure(const std::string& id) const;

  // Nodes with no prereqs, declaration order.
  std::vector<std::string> roots() const;

  // Nodes that list `id` as a direct prereq, declaration order.
  std::vector<std::string> dependents(const std::string& id) const;

  // Everything still needed to reach `id` (including `id` itself unless it is
  // already satisfied), ordered so each id follows all of its prereqs.
  // Unknown or dangling ids are appended to `errors` when it is non-null and
  // left out of the order.
  std::vector<std::string> prerequisite_order(const std::string& id, const IdSet& satisfied,
                                              std::vector<std::string>* errors = nullptr) const;

  // Depth-first cycle search over the whole graph. Intended for content load
  // and tests, not for per-frame queries.
  AcyclicCheck validate_acyclic() const;

 private:
  std::vector<DependencyNode> nodes_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace walkforage

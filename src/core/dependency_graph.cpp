#include "walkforage/core/dependency_graph.h"

#include <algorithm>
#include <deque>
#include <functional>
#include <utility>

namespace walkforage {

namespace {

bool is_satisfied(const IdSet& satisfied, const std::string& id) { return satisfied.find(id) != satisfied.end(); }

// 0 = unvisited, 1 = on the DFS stack, 2 = fully explored.
enum : unsigned char { kUnvisited = 0, kOnStack = 1, kDone = 2 };

} // namespace

DependencyGraph::DependencyGraph(std::vector<DependencyNode> nodes) {
  nodes_.reserve(nodes.size());
  index_.reserve(nodes.size() * 2);
  for (auto& n : nodes) {
    if (index_.find(n.id) != index_.end()) continue;
    index_.emplace(n.id, nodes_.size());
    nodes_.push_back(std::move(n));
  }
}

const DependencyNode* DependencyGraph::find(const std::string& id) const {
  const auto it = index_.find(id);
  return it == index_.end() ? nullptr : &nodes_[it->second];
}

std::optional<bool> DependencyGraph::is_available(const std::string& id, const IdSet& satisfied) const {
  const DependencyNode* n = find(id);
  if (!n) return std::nullopt;
  if (is_satisfied(satisfied, id)) return false;
  return std::all_of(n->prereqs.begin(), n->prereqs.end(),
                     [&](const std::string& p) { return is_satisfied(satisfied, p); });
}

std::vector<std::string> DependencyGraph::available_set(const IdSet& satisfied) const {
  std::vector<std::string> out;
  for (const auto& n : nodes_) {
    if (is_available(n.id, satisfied).value_or(false)) out.push_back(n.id);
  }
  return out;
}

std::vector<std::string> DependencyGraph::missing_prerequisites(const std::string& id, const IdSet& satisfied) const {
  std::vector<std::string> out;
  const DependencyNode* n = find(id);
  if (!n) return out;
  for (const auto& p : n->prereqs) {
    if (!is_satisfied(satisfied, p) && std::find(out.begin(), out.end(), p) == out.end()) out.push_back(p);
  }
  return out;
}

std::vector<std::string> DependencyGraph::transitive_closure(const std::string& id) const {
  std::vector<std::string> out;
  const DependencyNode* start = find(id);
  if (!start) return out;

  IdSet seen;
  seen.insert(id);
  std::deque<const DependencyNode*> queue;
  queue.push_back(start);

  while (!queue.empty()) {
    const DependencyNode* cur = queue.front();
    queue.pop_front();
    for (const auto& p : cur->prereqs) {
      if (!seen.insert(p).second) continue;
      out.push_back(p);
      // Dangling ids are listed but have nothing to expand.
      if (const DependencyNode* next = find(p)) queue.push_back(next);
    }
  }
  return out;
}

std::vector<std::string> DependencyGraph::roots() const {
  std::vector<std::string> out;
  for (const auto& n : nodes_) {
    if (n.prereqs.empty()) out.push_back(n.id);
  }
  return out;
}

std::vector<std::string> DependencyGraph::dependents(const std::string& id) const {
  std::vector<std::string> out;
  for (const auto& n : nodes_) {
    if (std::find(n.prereqs.begin(), n.prereqs.end(), id) != n.prereqs.end()) out.push_back(n.id);
  }
  return out;
}

std::vector<std::string> DependencyGraph::prerequisite_order(const std::string& id, const IdSet& satisfied,
                                                             std::vector<std::string>* errors) const {
  std::vector<std::string> order;
  const auto report = [&](std::string msg) {
    if (errors) errors->push_back(std::move(msg));
  };

  if (!find(id)) {
    report("Unknown id: '" + id + "'");
    return order;
  }

  std::unordered_map<std::string, unsigned char> state;
  state.reserve(nodes_.size() * 2);

  std::function<void(const std::string&)> visit = [&](const std::string& cur) {
    if (is_satisfied(satisfied, cur)) return;
    const unsigned char st = state[cur];
    if (st == kDone) return;
    if (st == kOnStack) {
      report("Prerequisite cycle involving '" + cur + "'");
      return;
    }

    const DependencyNode* n = find(cur);
    if (!n) {
      report("Missing definition for prerequisite '" + cur + "'");
      state[cur] = kDone;
      return;
    }

    state[cur] = kOnStack;
    for (const auto& p : n->prereqs) visit(p);
    state[cur] = kDone;
    order.push_back(cur);
  };

  visit(id);
  return order;
}

AcyclicCheck DependencyGraph::validate_acyclic() const {
  AcyclicCheck out;

  std::vector<unsigned char> state(nodes_.size(), kUnvisited);
  std::vector<bool> on_cycle(nodes_.size(), false);

  // Explicit DFS stack: node index + position of the next prereq to explore.
  struct Frame {
    std::size_t node;
    std::size_t next;
  };
  std::vector<Frame> stack;
  stack.reserve(nodes_.size());

  // Canonical (sorted) member lists of cycles already recorded.
  std::vector<std::vector<std::string>> seen_cycles;

  for (std::size_t root = 0; root < nodes_.size(); ++root) {
    if (state[root] != kUnvisited) continue;

    state[root] = kOnStack;
    stack.push_back(Frame{root, 0});

    while (!stack.empty()) {
      Frame& top = stack.back();
      const auto& prereqs = nodes_[top.node].prereqs;

      if (top.next >= prereqs.size()) {
        state[top.node] = kDone;
        stack.pop_back();
        continue;
      }

      const std::string& pid = prereqs[top.next++];
      const auto it = index_.find(pid);
      if (it == index_.end()) continue;
      const std::size_t p = it->second;

      if (state[p] == kUnvisited) {
        state[p] = kOnStack;
        stack.push_back(Frame{p, 0});
        continue;
      }
      if (state[p] == kDone) continue;

      // Back edge: p is on the stack, so stack[p..top] + p is a cycle.
      std::size_t start = stack.size();
      while (start > 0 && stack[start - 1].node != p) --start;
      if (start == 0) continue;
      --start;

      std::vector<std::string> cycle;
      for (std::size_t k = start; k < stack.size(); ++k) {
        cycle.push_back(nodes_[stack[k].node].id);
        on_cycle[stack[k].node] = true;
      }
      cycle.push_back(pid);

      std::vector<std::string> canon(cycle.begin(), cycle.end() - 1);
      std::sort(canon.begin(), canon.end());
      if (std::find(seen_cycles.begin(), seen_cycles.end(), canon) == seen_cycles.end()) {
        seen_cycles.push_back(std::move(canon));
        out.cycles.push_back(std::move(cycle));
      }
    }
  }

  for (std::size_t k = 0; k < nodes_.size(); ++k) {
    if (on_cycle[k]) out.offending.push_back(nodes_[k].id);
  }
  return out;
}

} // namespace walkforage

#pragma once

#include <string>
#include <vector>

#include "walkforage/core/dependency_graph.h"
#include "walkforage/core/tech.h"

namespace walkforage {

class ContentDB;

// Which techs still have to be unlocked to reach a target, and in what order.
struct UnlockPlan {
  // Prerequisites first; the target (when not yet unlocked) is last.
  std::vector<std::string> tech_ids;

  // Sum of the costs of tech_ids, one entry per resource type in first-seen order.
  std::vector<ResourceCost> total_cost;
};

struct UnlockPlanResult {
  UnlockPlan plan;
  std::vector<std::string> errors;

  bool ok() const { return errors.empty(); }
};

// Rules:
// - Techs in `unlocked` are omitted and not traversed.
// - An already unlocked target yields an empty plan without errors.
// - Unknown target, dangling prerequisites and cycles populate errors (sorted);
//   the partial plan is kept for inspection but carries no cost.
UnlockPlanResult compute_unlock_plan(const ContentDB& content, const IdSet& unlocked, const std::string& target_tech_id);

} // namespace walkforage

#include "walkforage/core/unlock_planner.h"

#include <algorithm>

#include "walkforage/core/content_db.h"

namespace walkforage {

UnlockPlanResult compute_unlock_plan(const ContentDB& content, const IdSet& unlocked,
                                     const std::string& target_tech_id) {
  UnlockPlanResult out;

  if (target_tech_id.empty()) {
    out.errors.push_back("Target tech id is empty");
    return out;
  }
  if (!content.find_tech(target_tech_id)) {
    out.errors.push_back("Unknown tech id: '" + target_tech_id + "'");
    return out;
  }

  out.plan.tech_ids = content.tech_graph().prerequisite_order(target_tech_id, unlocked, &out.errors);

  if (!out.errors.empty()) {
    std::sort(out.errors.begin(), out.errors.end());
    out.errors.erase(std::unique(out.errors.begin(), out.errors.end()), out.errors.end());
    return out;
  }

  for (const auto& id : out.plan.tech_ids) {
    const TechDef* t = content.find_tech(id);
    if (!t) continue;
    for (const auto& c : t->cost) {
      if (c.quantity <= 0) continue;
      auto it = std::find_if(out.plan.total_cost.begin(), out.plan.total_cost.end(),
                             [&](const ResourceCost& rc) { return rc.resource_type == c.resource_type; });
      if (it == out.plan.total_cost.end()) {
        out.plan.total_cost.push_back(c);
      } else {
        it->quantity += c.quantity;
      }
    }
  }
  return out;
}

} // namespace walkforage

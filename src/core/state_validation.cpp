#include "walkforage/core/state_validation.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "walkforage/core/content_db.h"
#include "walkforage/core/session.h"
#include "walkforage/util/sorted_keys.h"

namespace walkforage {

namespace {

void check_items(const ContentDB& content, const std::vector<OwnedItem>& items, CraftableKind expected,
                 std::unordered_set<std::string>& instance_ids, std::vector<std::string>& errors) {
  const std::string list = expected == CraftableKind::Tool ? "owned_tools" : "owned_components";
  for (const auto& it : items) {
    if (it.instance_id.empty()) {
      errors.push_back(list + " has an item of '" + it.craftable_id + "' with an empty instance id");
    } else if (!instance_ids.insert(it.instance_id).second) {
      errors.push_back("Duplicate instance id '" + it.instance_id + "'");
    }

    const CraftableDef* c = content.find_craftable(it.craftable_id);
    if (!c) {
      errors.push_back(list + " references unknown craftable '" + it.craftable_id + "'");
    } else if (c->kind != expected) {
      errors.push_back(list + " holds '" + it.craftable_id + "', which is a " + craftable_kind_label(c->kind));
    } else if (it.kind != expected) {
      errors.push_back("Instance '" + it.instance_id + "' in " + list + " is recorded as a " +
                       craftable_kind_label(it.kind));
    }

    for (const auto& m : it.materials) {
      if (!content.find_material(m.resource_type, m.material_id)) {
        errors.push_back("Instance '" + it.instance_id + "' was made from unknown " + m.resource_type + " material '" +
                         m.material_id + "'");
      } else if (m.quantity <= 0) {
        errors.push_back("Instance '" + it.instance_id + "' lists " + m.material_id + " with non-positive quantity");
      }
    }

    if (!std::isfinite(it.quality) || it.quality < 0.0 || it.quality > 1.0) {
      errors.push_back("Instance '" + it.instance_id + "' has quality outside [0,1]");
    }
  }
}

} // namespace

std::vector<std::string> validate_session_state(const ContentDB& content, const SessionState& state) {
  std::vector<std::string> errors;

  for (const auto& type : util::sorted_keys(state.inventory.raw())) {
    if (!content.resource_types().contains(type)) {
      errors.push_back("Inventory holds unknown resource type '" + type + "'");
      continue;
    }
    std::unordered_set<std::string> seen;
    for (const auto& s : state.inventory.stacks(type)) {
      if (!content.find_material(type, s.material_id)) {
        errors.push_back("Inventory holds unknown " + type + " material '" + s.material_id + "'");
      }
      if (s.quantity <= 0) {
        errors.push_back("Inventory stack " + type + "/" + s.material_id + " has non-positive quantity " +
                         std::to_string(s.quantity));
      }
      if (!seen.insert(s.material_id).second) {
        errors.push_back("Inventory has more than one stack of " + type + "/" + s.material_id);
      }
    }
  }

  for (const auto& id : state.unlocked_techs) {
    if (!content.find_tech(id)) errors.push_back("Unlocked tech '" + id + "' is unknown");
  }

  std::unordered_set<std::string> instance_ids;
  check_items(content, state.owned_tools, CraftableKind::Tool, instance_ids, errors);
  check_items(content, state.owned_components, CraftableKind::Component, instance_ids, errors);

  if (state.next_instance_seq < 1) errors.push_back("next_instance_seq must be positive");

  std::sort(errors.begin(), errors.end());
  errors.erase(std::unique(errors.begin(), errors.end()), errors.end());
  return errors;
}

} // namespace walkforage

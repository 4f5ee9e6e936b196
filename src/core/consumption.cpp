#include "walkforage/core/consumption.h"

#include <limits>
#include <utility>

#include "walkforage/core/content_db.h"

namespace walkforage {

namespace {

SpendResult fail(SpendErrorKind kind, const std::string& resource_type, std::string message) {
  SpendResult r;
  r.error.kind = kind;
  r.error.resource_type = resource_type;
  r.error.message = std::move(message);
  return r;
}

// Entries for one type, merged per material, first-seen order. Only called
// after the exact-quantity check, so every merged total is <= the requirement.
std::vector<SelectionEntry> aggregate(const std::vector<SelectionEntry>& entries) {
  std::vector<SelectionEntry> out;
  for (const auto& e : entries) {
    bool merged = false;
    for (auto& o : out) {
      if (o.material_id == e.material_id) {
        o.quantity += e.quantity;
        merged = true;
        break;
      }
    }
    if (!merged) out.push_back(e);
  }
  return out;
}

} // namespace

const char* spend_error_kind_label(SpendErrorKind k) {
  switch (k) {
    case SpendErrorKind::None: return "none";
    case SpendErrorKind::NoSelection: return "no_selection";
    case SpendErrorKind::WrongQuantitySelected: return "wrong_quantity_selected";
    case SpendErrorKind::InsufficientMaterial: return "insufficient_material";
    case SpendErrorKind::InvalidMaterial: return "invalid_material";
    case SpendErrorKind::AlreadyUnlocked: return "already_unlocked";
    case SpendErrorKind::MissingPrerequisites: return "missing_prerequisites";
    case SpendErrorKind::UnknownTarget: return "unknown_target";
    case SpendErrorKind::WrongComponentSelection: return "wrong_component_selection";
  }
  return "unknown";
}

std::vector<SpendRequirement> spend_requirements(const std::vector<ResourceCost>& cost) {
  std::vector<SpendRequirement> out;
  out.reserve(cost.size());
  for (const auto& c : cost) out.push_back(SpendRequirement{c.resource_type, c.quantity, false});
  return out;
}

std::vector<SpendRequirement> spend_requirements(const std::vector<MaterialSlot>& slots) {
  std::vector<SpendRequirement> out;
  out.reserve(slots.size());
  for (const auto& s : slots) out.push_back(SpendRequirement{s.resource_type, s.quantity, s.requires_toolstone});
  return out;
}

SpendResult attempt_spend(const std::vector<SpendRequirement>& requirements, const Selection& selection,
                          Inventory& inventory, const ContentDB* content) {
  static const std::vector<SelectionEntry> kNone;
  const auto entries_for = [&](const std::string& type) -> const std::vector<SelectionEntry>& {
    const auto it = selection.find(type);
    return it == selection.end() ? kNone : it->second;
  };

  // 1. Every required type has a selection.
  for (const auto& req : requirements) {
    if (req.quantity <= 0) continue;
    if (entries_for(req.resource_type).empty()) {
      return fail(SpendErrorKind::NoSelection, req.resource_type,
                  "No " + req.resource_type + " selected (need " + std::to_string(req.quantity) + ")");
    }
  }

  // 2. Exact quantities.
  for (const auto& req : requirements) {
    if (req.quantity <= 0) continue;
    long long sum = 0;
    bool bad = false;
    for (const auto& e : entries_for(req.resource_type)) {
      if (e.quantity < 0) bad = true;
      sum += e.quantity;
      if (sum > req.quantity) bad = true;
    }
    if (bad || sum != req.quantity) {
      SpendResult r = fail(SpendErrorKind::WrongQuantitySelected, req.resource_type,
                           "Selected " + std::to_string(sum) + " " + req.resource_type + ", need exactly " +
                               std::to_string(req.quantity));
      r.error.have = sum > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max() : static_cast<int>(sum);
      r.error.needed = req.quantity;
      return r;
    }
  }

  // 3. Materials are real and meet the toolstone flag.
  if (content) {
    for (const auto& req : requirements) {
      if (req.quantity <= 0) continue;
      for (const auto& e : entries_for(req.resource_type)) {
        if (e.quantity == 0) continue;
        const MaterialDef* m = content->find_material(req.resource_type, e.material_id);
        std::string why;
        if (!m) {
          why = "'" + e.material_id + "' is not a known " + req.resource_type;
        } else if (req.requires_toolstone && !m->toolstone) {
          why = "'" + e.material_id + "' is not toolstone";
        } else {
          continue;
        }
        SpendResult r = fail(SpendErrorKind::InvalidMaterial, req.resource_type, why);
        r.error.material_id = e.material_id;
        return r;
      }
    }
  }

  // 4. Stacks cover the request.
  std::vector<UsedMaterial> plan;
  for (const auto& req : requirements) {
    if (req.quantity <= 0) continue;
    for (const auto& e : aggregate(entries_for(req.resource_type))) {
      if (e.quantity == 0) continue;
      const int have = inventory.count(req.resource_type, e.material_id);
      if (have < e.quantity) {
        SpendResult r = fail(SpendErrorKind::InsufficientMaterial, req.resource_type,
                             "Not enough " + e.material_id + ": have " + std::to_string(have) + ", need " +
                                 std::to_string(e.quantity));
        r.error.material_id = e.material_id;
        r.error.have = have;
        r.error.needed = e.quantity;
        return r;
      }
      plan.push_back(UsedMaterial{req.resource_type, e.material_id, e.quantity});
    }
  }

  // 5. Apply on a copy so a requirement list naming one type twice still
  // cannot leave a partial debit behind.
  Inventory next = inventory;
  for (const auto& u : plan) {
    if (!next.remove(u.resource_type, u.material_id, u.quantity)) {
      SpendResult r = fail(SpendErrorKind::InsufficientMaterial, u.resource_type,
                           "Not enough " + u.material_id + " for the combined request");
      r.error.material_id = u.material_id;
      r.error.have = inventory.count(u.resource_type, u.material_id);
      r.error.needed = u.quantity;
      return r;
    }
  }
  inventory = std::move(next);

  SpendResult ok;
  ok.consumed = std::move(plan);
  return ok;
}

int toolstone_total(const Inventory& inventory, const ContentDB& content, const std::string& resource_type) {
  int total = 0;
  for (const auto& s : inventory.stacks(resource_type)) {
    const MaterialDef* m = content.find_material(resource_type, s.material_id);
    if (m && m->toolstone) total += s.quantity;
  }
  return total;
}

} // namespace walkforage

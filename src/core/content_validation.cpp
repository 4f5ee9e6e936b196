#include "walkforage/core/content_validation.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "walkforage/util/sorted_keys.h"
#include "walkforage/util/strings.h"

namespace walkforage {

namespace {

constexpr double kWeightSumTolerance = 1e-6;

void push_issue(std::vector<ContentIssue>& out, ContentIssueSeverity sev, std::string code, std::string msg,
                std::string subject_kind, std::string subject_id) {
  ContentIssue is;
  is.severity = sev;
  is.code = std::move(code);
  is.message = std::move(msg);
  is.subject_kind = std::move(subject_kind);
  is.subject_id = std::move(subject_id);
  out.push_back(std::move(is));
}

void push_error(std::vector<ContentIssue>& out, std::string code, std::string msg, std::string subject_kind = {},
                std::string subject_id = {}) {
  push_issue(out, ContentIssueSeverity::Error, std::move(code), std::move(msg), std::move(subject_kind),
             std::move(subject_id));
}

void push_warning(std::vector<ContentIssue>& out, std::string code, std::string msg, std::string subject_kind = {},
                  std::string subject_id = {}) {
  push_issue(out, ContentIssueSeverity::Warning, std::move(code), std::move(msg), std::move(subject_kind),
             std::move(subject_id));
}

template <typename... Parts>
std::string cat(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

bool contains(const std::vector<std::string>& v, const std::string& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

// Checks one per-type weight map against the type's schema.
void check_weights(std::vector<ContentIssue>& issues, const std::string& kind, const std::string& owner,
                   const ResourceTypeDef& type, const std::unordered_map<std::string, double>& weights) {
  double sum = 0.0;
  for (const auto& axis : util::sorted_keys(weights)) {
    const double w = weights.at(axis);
    if (!type.find_property(axis)) {
      push_error(issues, kind + ".weights_unknown_axis",
                 cat(owner, " weights '", type.id, "' name unknown property '", axis, "'"), kind, owner);
    }
    if (!std::isfinite(w) || w < 0.0) {
      push_error(issues, kind + ".weights_negative",
                 cat(owner, " weight '", type.id, ".", axis, "' must be a non-negative number (got ", w, ")"), kind,
                 owner);
      continue;
    }
    sum += w;
  }
  if (std::fabs(sum - 1.0) > kWeightSumTolerance) {
    push_error(issues, kind + ".weights_sum",
               cat(owner, " weights for '", type.id, "' sum to ", sum, " (expected 1.0)"), kind, owner);
  }
}

void check_resource_types(const ContentTables& t, std::vector<ContentIssue>& issues) {
  std::unordered_set<std::string> seen;
  for (const auto& rt : t.resource_types) {
    if (rt.id.empty()) {
      push_error(issues, "resource_type.empty_id", "Resource type with an empty id", "resource_type", rt.id);
      continue;
    }
    if (!seen.insert(rt.id).second) {
      push_error(issues, "resource_type.duplicate_id", cat("Resource type '", rt.id, "' is defined more than once"),
                 "resource_type", rt.id);
    }

    std::unordered_set<std::string> axes;
    for (const auto& p : rt.property_schema) {
      if (p.id.empty()) {
        push_error(issues, "resource_type.empty_property", cat("Resource type '", rt.id, "' has an unnamed property"),
                   "resource_type", rt.id);
        continue;
      }
      if (!axes.insert(p.id).second) {
        push_error(issues, "resource_type.duplicate_property",
                   cat("Resource type '", rt.id, "' lists property '", p.id, "' twice"), "resource_type", rt.id);
      }
      if (!std::isfinite(p.min_value) || !std::isfinite(p.max_value) || p.min_value >= p.max_value) {
        push_error(issues, "resource_type.invalid_range",
                   cat("Resource type '", rt.id, "' property '", p.id, "' has invalid range [", p.min_value, ", ",
                       p.max_value, "]"),
                   "resource_type", rt.id);
      }
    }

    if (!rt.default_quality_weights.empty()) {
      check_weights(issues, "resource_type", rt.id, rt, rt.default_quality_weights);
    }
  }
}

void check_materials(const ContentTables& t, const ResourceTypeRegistry& registry, std::vector<ContentIssue>& issues) {
  std::unordered_set<std::string> seen;
  for (const auto& m : t.materials) {
    if (m.id.empty()) {
      push_error(issues, "material.empty_id", cat("Material of type '", m.resource_type, "' has an empty id"),
                 "material", m.id);
      continue;
    }
    if (!seen.insert(m.resource_type + "/" + m.id).second) {
      push_error(issues, "material.duplicate_id",
                 cat("Material '", m.id, "' is defined more than once for type '", m.resource_type, "'"), "material",
                 m.id);
    }
    if (!std::isfinite(m.rarity) || m.rarity < 0.0 || m.rarity > 1.0) {
      push_error(issues, "material.invalid_rarity", cat("Material '", m.id, "' has rarity outside [0,1]: ", m.rarity),
                 "material", m.id);
    }

    const ResourceTypeDef* type = registry.find(m.resource_type);
    if (!type) {
      push_error(issues, "material.unknown_type",
                 cat("Material '", m.id, "' has unknown resource type '", m.resource_type, "'"), "material", m.id);
      continue;
    }
    if (m.toolstone && !type->has_toolstone) {
      push_error(issues, "material.toolstone_unsupported",
                 cat("Material '", m.id, "' is flagged toolstone but type '", type->id, "' has no toolstone"),
                 "material", m.id);
    }

    for (const auto& axis : util::sorted_keys(m.properties)) {
      const double v = m.properties.at(axis);
      const PropertyDef* p = type->find_property(axis);
      if (!p) {
        push_error(issues, "material.unknown_property",
                   cat("Material '", m.id, "' has property '", axis, "' not in the '", type->id, "' schema"),
                   "material", m.id);
        continue;
      }
      if (!std::isfinite(v) || v < p->min_value || v > p->max_value) {
        push_error(issues, "material.property_out_of_range",
                   cat("Material '", m.id, "' property '", axis, "' = ", v, " is outside [", p->min_value, ", ",
                       p->max_value, "]"),
                   "material", m.id);
      }
    }
    for (const auto& p : type->property_schema) {
      if (m.properties.find(p.id) == m.properties.end()) {
        push_error(issues, "material.missing_property", cat("Material '", m.id, "' has no value for '", p.id, "'"),
                   "material", m.id);
      }
    }
  }
}

void check_graph(const DependencyGraph& graph, const std::string& kind, const std::string& noun,
                 std::vector<ContentIssue>& issues) {
  if (graph.size() == 0) return;

  const AcyclicCheck acyclic = graph.validate_acyclic();
  for (const auto& cycle : acyclic.cycles) {
    push_error(issues, kind + ".cycle", cat(noun, " cycle detected: ", join(cycle, " -> ")), kind, cycle.front());
  }
  if (graph.roots().empty()) {
    push_error(issues, kind + ".no_root", cat("No ", kind, " is free of requirements; nothing can ever be started"),
               "content", kind);
  }
}

void check_techs(const ContentTables& t, const ResourceTypeRegistry& registry, const DependencyGraph& graph,
                 std::vector<ContentIssue>& issues) {
  std::unordered_map<std::string, const TechDef*> by_id;
  std::unordered_set<std::string> craftable_ids;
  for (const auto& c : t.craftables) craftable_ids.insert(c.id);

  for (const auto& tech : t.techs) {
    if (tech.id.empty()) {
      push_error(issues, "tech.empty_id", "Tech with an empty id", "tech", tech.id);
      continue;
    }
    if (!by_id.emplace(tech.id, &tech).second) {
      push_error(issues, "tech.duplicate_id", cat("Tech '", tech.id, "' is defined more than once"), "tech", tech.id);
    }
  }

  for (const auto& tech : t.techs) {
    if (tech.id.empty()) continue;
    const std::string& key = tech.id;

    std::unordered_set<std::string> seen_prereqs;
    for (const auto& pre : tech.prerequisites) {
      if (pre.empty()) {
        push_error(issues, "tech.empty_prereq", cat("Tech '", key, "' has an empty prerequisite id"), "tech", key);
        continue;
      }
      if (pre == key) {
        push_error(issues, "tech.self_prereq", cat("Tech '", key, "' lists itself as a prerequisite"), "tech", key);
        continue;
      }
      if (!seen_prereqs.insert(pre).second) {
        push_warning(issues, "tech.duplicate_prereq", cat("Tech '", key, "' lists prerequisite '", pre, "' twice"),
                     "tech", key);
      }
      const auto it = by_id.find(pre);
      if (it == by_id.end()) {
        push_error(issues, "tech.unknown_prereq", cat("Tech '", key, "' references unknown prerequisite '", pre, "'"),
                   "tech", key);
      } else if (!contains(it->second->unlocks, key)) {
        push_error(issues, "tech.prereq_not_symmetric",
                   cat("Tech '", key, "' requires '", pre, "', but '", pre, "' does not list '", key, "' in unlocks"),
                   "tech", key);
      }
    }

    for (const auto& unlock : tech.unlocks) {
      const auto it = by_id.find(unlock);
      if (it == by_id.end()) {
        push_error(issues, "tech.unknown_unlock", cat("Tech '", key, "' unlocks unknown tech '", unlock, "'"), "tech",
                   key);
      } else if (!contains(it->second->prerequisites, key)) {
        push_error(issues, "tech.unlock_not_symmetric",
                   cat("Tech '", key, "' unlocks '", unlock, "', but '", unlock, "' does not require '", key, "'"),
                   "tech", key);
      }
    }

    std::unordered_set<std::string> cost_types;
    for (const auto& c : tech.cost) {
      if (!registry.contains(c.resource_type)) {
        push_error(issues, "tech.cost_unknown_type",
                   cat("Tech '", key, "' costs unknown resource type '", c.resource_type, "'"), "tech", key);
      }
      if (c.quantity <= 0) {
        push_error(issues, "tech.cost_invalid_quantity",
                   cat("Tech '", key, "' has non-positive cost for '", c.resource_type, "': ", c.quantity), "tech",
                   key);
      }
      if (!cost_types.insert(c.resource_type).second) {
        push_error(issues, "tech.cost_duplicate_type",
                   cat("Tech '", key, "' lists a cost for '", c.resource_type, "' twice"), "tech", key);
      }
    }

    for (const auto& recipe : tech.enables_recipes) {
      if (craftable_ids.find(recipe) == craftable_ids.end()) {
        push_error(issues, "tech.unknown_recipe", cat("Tech '", key, "' enables unknown recipe '", recipe, "'"), "tech",
                   key);
      }
    }

    if (tech.unlocks.empty() && tech.enables_recipes.empty()) {
      push_warning(issues, "lint.tech_enables_nothing", cat("Tech '", key, "' unlocks no tech and enables no recipe"),
                   "tech", key);
    }
  }

  check_graph(graph, "tech", "Tech prerequisite", issues);
}

void check_requirements(const CraftableDef& c, const std::vector<ItemRequirement>& reqs, CraftableKind expected,
                        const std::unordered_map<std::string, const CraftableDef*>& by_id,
                        std::vector<ContentIssue>& issues) {
  const std::string noun = craftable_kind_label(expected);
  std::unordered_set<std::string> seen;
  for (const auto& r : reqs) {
    if (r.id == c.id) {
      push_error(issues, "craftable.self_requirement", cat("Craftable '", c.id, "' requires itself"), "craftable",
                 c.id);
      continue;
    }
    if (!seen.insert(r.id).second) {
      push_error(issues, "craftable.duplicate_requirement",
                 cat("Craftable '", c.id, "' lists required ", noun, " '", r.id, "' twice"), "craftable", c.id);
    }
    if (r.quantity <= 0) {
      push_error(issues, "craftable.invalid_requirement_quantity",
                 cat("Craftable '", c.id, "' requires non-positive quantity of '", r.id, "': ", r.quantity),
                 "craftable", c.id);
    }
    const auto it = by_id.find(r.id);
    if (it == by_id.end()) {
      push_error(issues, "craftable.unknown_" + noun,
                 cat("Craftable '", c.id, "' requires unknown ", noun, " '", r.id, "'"), "craftable", c.id);
    } else if (it->second->kind != expected) {
      push_error(issues, "craftable.not_a_" + noun,
                 cat("Craftable '", c.id, "' requires '", r.id, "' as a ", noun, ", but it is a ",
                     craftable_kind_label(it->second->kind)),
                 "craftable", c.id);
    }
  }
}

void check_craftables(const ContentTables& t, const ResourceTypeRegistry& registry, const DependencyGraph& graph,
                      std::vector<ContentIssue>& issues) {
  std::unordered_map<std::string, const CraftableDef*> by_id;
  for (const auto& c : t.craftables) {
    if (c.id.empty()) {
      push_error(issues, "craftable.empty_id", "Craftable with an empty id", "craftable", c.id);
      continue;
    }
    if (!by_id.emplace(c.id, &c).second) {
      push_error(issues, "craftable.duplicate_id", cat("Craftable '", c.id, "' is defined more than once"),
                 "craftable", c.id);
    }
  }

  std::unordered_set<std::string> tech_ids;
  std::unordered_set<std::string> enabled;
  for (const auto& tech : t.techs) {
    tech_ids.insert(tech.id);
    for (const auto& r : tech.enables_recipes) enabled.insert(r);
  }

  for (const auto& c : t.craftables) {
    if (c.id.empty()) continue;
    const std::string& key = c.id;

    if (!c.required_tech.empty() && tech_ids.find(c.required_tech) == tech_ids.end()) {
      push_error(issues, "craftable.unknown_tech",
                 cat("Craftable '", key, "' requires unknown tech '", c.required_tech, "'"), "craftable", key);
    }

    check_requirements(c, c.required_tools, CraftableKind::Tool, by_id, issues);
    check_requirements(c, c.required_components, CraftableKind::Component, by_id, issues);

    std::unordered_set<std::string> slot_types;
    for (const auto& slot : c.materials) {
      if (!slot_types.insert(slot.resource_type).second) {
        push_error(issues, "craftable.slot_duplicate_type",
                   cat("Craftable '", key, "' has two material slots of type '", slot.resource_type, "'"),
                   "craftable", key);
      }
      if (slot.quantity <= 0) {
        push_error(issues, "craftable.slot_invalid_quantity",
                   cat("Craftable '", key, "' has non-positive quantity for '", slot.resource_type, "': ",
                       slot.quantity),
                   "craftable", key);
      }
      const ResourceTypeDef* type = registry.find(slot.resource_type);
      if (!type) {
        push_error(issues, "craftable.slot_unknown_type",
                   cat("Craftable '", key, "' has a slot of unknown resource type '", slot.resource_type, "'"),
                   "craftable", key);
        continue;
      }
      if (slot.requires_toolstone && !type->has_toolstone) {
        push_error(issues, "craftable.slot_toolstone_unsupported",
                   cat("Craftable '", key, "' requires toolstone of type '", type->id, "', which has none"),
                   "craftable", key);
      }
      if (!type->property_schema.empty() && c.quality_weights.find(type->id) == c.quality_weights.end() &&
          type->default_quality_weights.empty()) {
        push_error(issues, "craftable.weights_missing",
                   cat("Craftable '", key, "' has no quality weights for '", type->id,
                       "' and the type has no defaults"),
                   "craftable", key);
      }
    }

    for (const auto& type_id : util::sorted_keys(c.quality_weights)) {
      const ResourceTypeDef* type = registry.find(type_id);
      if (!type) {
        push_error(issues, "craftable.weights_unknown_type",
                   cat("Craftable '", key, "' has quality weights for unknown type '", type_id, "'"), "craftable",
                   key);
        continue;
      }
      check_weights(issues, "craftable", key, *type, c.quality_weights.at(type_id));
    }

    if (enabled.find(key) == enabled.end()) {
      push_warning(issues, "lint.craftable_not_enabled", cat("Craftable '", key, "' is not enabled by any tech"),
                   "craftable", key);
    }
  }

  check_graph(graph, "craftable", "Craftable requirement", issues);
}

} // namespace

std::vector<ContentIssue> validate_content_detailed(const ContentTables& tables) {
  std::vector<ContentIssue> issues;

  // Index without validating so every check works on the same lookup rules
  // the runtime uses (first definition wins).
  const ContentDB db(tables);

  check_resource_types(tables, issues);
  check_materials(tables, db.resource_types(), issues);
  check_techs(tables, db.resource_types(), db.tech_graph(), issues);
  check_craftables(tables, db.resource_types(), db.craftable_graph(), issues);

  std::sort(issues.begin(), issues.end(), [](const ContentIssue& a, const ContentIssue& b) {
    if (a.severity != b.severity) return a.severity < b.severity;
    if (a.subject_kind != b.subject_kind) return a.subject_kind < b.subject_kind;
    if (a.subject_id != b.subject_id) return a.subject_id < b.subject_id;
    if (a.code != b.code) return a.code < b.code;
    return a.message < b.message;
  });
  issues.erase(std::unique(issues.begin(), issues.end(),
                           [](const ContentIssue& a, const ContentIssue& b) {
                             return a.severity == b.severity && a.code == b.code && a.message == b.message &&
                                    a.subject_id == b.subject_id;
                           }),
               issues.end());
  return issues;
}

std::vector<std::string> validate_content(const ContentTables& tables) {
  std::vector<std::string> errors;
  for (const auto& is : validate_content_detailed(tables)) {
    if (is.severity == ContentIssueSeverity::Error) errors.push_back(is.message);
  }
  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace walkforage

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace walkforage {

enum class CraftableKind { Tool, Component };

const char* craftable_kind_label(CraftableKind k);

// Returns false for anything other than "tool" / "component".
bool parse_craftable_kind(const std::string& s, CraftableKind& out);

struct ItemRequirement {
  std::string id;
  int quantity{1};
};

// A raw-material slot, filled from the player's stacks of one resource type.
struct MaterialSlot {
  std::string resource_type;
  int quantity{0};
  bool requires_toolstone{false};
};

// Resource type -> property axis -> weight. Each per-type map sums to 1.0.
using QualityWeights = std::unordered_map<std::string, std::unordered_map<std::string, double>>;

struct CraftableDef {
  std::string id;
  std::string name;
  CraftableKind kind{CraftableKind::Tool};
  std::string category;
  std::string era;
  std::string description;

  std::string required_tech;

  // Tools are checked for ownership, never consumed.
  std::vector<ItemRequirement> required_tools;
  // Component instances are consumed by the craft.
  std::vector<ItemRequirement> required_components;

  // At most one slot per resource type.
  std::vector<MaterialSlot> materials;

  QualityWeights quality_weights;

  const MaterialSlot* find_slot(const std::string& resource_type) const;

  // Direct requirement ids, tools first then components, without duplicates.
  std::vector<std::string> requirement_ids() const;
};

} // namespace walkforage

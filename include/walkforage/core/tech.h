#pragma once

#include <string>
#include <vector>

namespace walkforage {

// Amount of one resource type, paid from any mix of that type's stacks.
struct ResourceCost {
  std::string resource_type;
  int quantity{0};
};

struct TechDef {
  std::string id;
  std::string name;
  std::string era;
  std::string description;

  std::vector<std::string> prerequisites;
  std::vector<ResourceCost> cost;

  // Techs that list this one as a prerequisite (kept symmetric by content validation).
  std::vector<std::string> unlocks;

  // Craftable ids this tech makes available.
  std::vector<std::string> enables_recipes;
};

} // namespace walkforage

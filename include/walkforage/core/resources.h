#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace walkforage {

// One numeric axis of a resource type (e.g. hardness), on [min_value, max_value].
struct PropertyDef {
  std::string id;
  std::string abbreviation;
  std::string display_name;
  double min_value{1.0};
  double max_value{10.0};
};

// A data-driven resource category (stone, wood, food, ...).
//
// The property schema is consulted both when validating materials and when
// scoring crafted items, so adding a category needs no engine changes.
struct ResourceTypeDef {
  std::string id;
  std::string singular_name;
  std::string plural_name;
  std::string icon;

  // Ordered; may be empty (e.g. food has no quality axes).
  std::vector<PropertyDef> property_schema;

  // Used by craftables that do not declare weights for this type.
  std::unordered_map<std::string, double> default_quality_weights;

  // Materials of this type may carry the toolstone flag.
  bool has_toolstone{false};

  const PropertyDef* find_property(const std::string& axis) const;
};

struct MaterialDef {
  std::string id;
  std::string name;
  std::string resource_type;
  std::string category;
  std::string description;
  std::string color;

  // Spawn weight in [0,1].
  double rarity{0.0};

  // Suitable for knapping into edged tools.
  bool toolstone{false};

  // Axis id -> value on the type's schema scale.
  std::unordered_map<std::string, double> properties;
};

// Registry of resource types, in declaration order.
class ResourceTypeRegistry {
 public:
  // Returns false (and ignores the definition) if the id is already registered.
  bool add(ResourceTypeDef def);

  const ResourceTypeDef* find(const std::string& id) const;
  bool contains(const std::string& id) const { return find(id) != nullptr; }

  const std::vector<ResourceTypeDef>& types() const { return types_; }
  std::vector<std::string> ids() const;
  std::size_t size() const { return types_.size(); }
  bool empty() const { return types_.empty(); }

 private:
  std::vector<ResourceTypeDef> types_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace walkforage

#include "walkforage/core/resources.h"

#include <utility>

namespace walkforage {

const PropertyDef* ResourceTypeDef::find_property(const std::string& axis) const {
  for (const auto& p : property_schema) {
    if (p.id == axis) return &p;
  }
  return nullptr;
}

bool ResourceTypeRegistry::add(ResourceTypeDef def) {
  if (index_.find(def.id) != index_.end()) return false;
  index_.emplace(def.id, types_.size());
  types_.push_back(std::move(def));
  return true;
}

const ResourceTypeDef* ResourceTypeRegistry::find(const std::string& id) const {
  const auto it = index_.find(id);
  return it == index_.end() ? nullptr : &types_[it->second];
}

std::vector<std::string> ResourceTypeRegistry::ids() const {
  std::vector<std::string> out;
  out.reserve(types_.size());
  for (const auto& t : types_) out.push_back(t.id);
  return out;
}

} // namespace walkforage

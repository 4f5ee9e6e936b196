#include "walkforage/core/craftable.h"

#include <algorithm>

namespace walkforage {

const char* craftable_kind_label(CraftableKind k) {
  switch (k) {
    case CraftableKind::Tool: return "tool";
    case CraftableKind::Component: return "component";
  }
  return "tool";
}

bool parse_craftable_kind(const std::string& s, CraftableKind& out) {
  if (s == "tool") {
    out = CraftableKind::Tool;
    return true;
  }
  if (s == "component") {
    out = CraftableKind::Component;
    return true;
  }
  return false;
}

const MaterialSlot* CraftableDef::find_slot(const std::string& resource_type) const {
  for (const auto& slot : materials) {
    if (slot.resource_type == resource_type) return &slot;
  }
  return nullptr;
}

std::vector<std::string> CraftableDef::requirement_ids() const {
  std::vector<std::string> out;
  out.reserve(required_tools.size() + required_components.size());
  const auto add = [&](const std::string& id) {
    if (std::find(out.begin(), out.end(), id) == out.end()) out.push_back(id);
  };
  for (const auto& t : required_tools) add(t.id);
  for (const auto& c : required_components) add(c.id);
  return out;
}

} // namespace walkforage

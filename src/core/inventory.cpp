#include "walkforage/core/inventory.h"

#include <algorithm>

#include "walkforage/util/sorted_keys.h"

namespace walkforage {

namespace {

const std::vector<ResourceStack>& empty_stacks() {
  static const std::vector<ResourceStack> kEmpty;
  return kEmpty;
}

template <typename Stacks>
auto find_stack(Stacks& stacks, const std::string& material_id) {
  return std::find_if(stacks.begin(), stacks.end(),
                      [&](const ResourceStack& s) { return s.material_id == material_id; });
}

} // namespace

bool operator==(const ResourceStack& a, const ResourceStack& b) {
  return a.material_id == b.material_id && a.quantity == b.quantity;
}

bool operator!=(const ResourceStack& a, const ResourceStack& b) { return !(a == b); }

void Inventory::add(const std::string& resource_type, const std::string& material_id, int quantity) {
  if (quantity <= 0) return;
  auto& stacks = by_type_[resource_type];
  auto it = find_stack(stacks, material_id);
  if (it != stacks.end()) {
    it->quantity += quantity;
  } else {
    stacks.push_back(ResourceStack{material_id, quantity});
  }
}

bool Inventory::remove(const std::string& resource_type, const std::string& material_id, int quantity) {
  if (quantity < 0) return false;
  if (quantity == 0) return true;

  auto type_it = by_type_.find(resource_type);
  if (type_it == by_type_.end()) return false;

  auto& stacks = type_it->second;
  auto it = find_stack(stacks, material_id);
  if (it == stacks.end() || it->quantity < quantity) return false;

  it->quantity -= quantity;
  if (it->quantity == 0) {
    stacks.erase(it);
    if (stacks.empty()) by_type_.erase(type_it);
  }
  return true;
}

int Inventory::count(const std::string& resource_type, const std::string& material_id) const {
  const auto& s = stacks(resource_type);
  const auto it = find_stack(s, material_id);
  return it == s.end() ? 0 : it->quantity;
}

bool Inventory::has(const std::string& resource_type, const std::string& material_id, int quantity) const {
  return count(resource_type, material_id) >= quantity;
}

int Inventory::total(const std::string& resource_type) const {
  int sum = 0;
  for (const auto& s : stacks(resource_type)) sum += s.quantity;
  return sum;
}

const std::vector<ResourceStack>& Inventory::stacks(const std::string& resource_type) const {
  const auto it = by_type_.find(resource_type);
  return it == by_type_.end() ? empty_stacks() : it->second;
}

std::vector<std::string> Inventory::resource_types() const { return util::sorted_keys(by_type_); }

void Inventory::merge(const Inventory& other) {
  for (const auto& type : other.resource_types()) {
    for (const auto& s : other.stacks(type)) add(type, s.material_id, s.quantity);
  }
}

InventoryBuilder& InventoryBuilder::put(const std::string& resource_type, const std::string& material_id,
                                        int quantity) {
  inv_.by_type_[resource_type].push_back(ResourceStack{material_id, quantity});
  return *this;
}

} // namespace walkforage

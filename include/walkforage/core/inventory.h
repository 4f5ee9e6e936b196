#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace walkforage {

struct ResourceStack {
  std::string material_id;
  int quantity{0};
};

bool operator==(const ResourceStack& a, const ResourceStack& b);
bool operator!=(const ResourceStack& a, const ResourceStack& b);

// Per-resource-type stacks of raw materials.
//
// Invariants:
// - at most one stack per material id within a type,
// - every stored stack has quantity > 0 (a stack reaching 0 is erased),
// - a type with no stacks has no entry.
class Inventory {
 public:
  // Adds to an existing stack or appends a new one at the end of the type's list.
  // Non-positive quantities are ignored.
  void add(const std::string& resource_type, const std::string& material_id, int quantity);

  // Removes `quantity` from one stack. Returns false and leaves the inventory
  // untouched if the stack is missing or short.
  bool remove(const std::string& resource_type, const std::string& material_id, int quantity);

  int count(const std::string& resource_type, const std::string& material_id) const;
  bool has(const std::string& resource_type, const std::string& material_id, int quantity) const;

  // Sum over every stack of the type.
  int total(const std::string& resource_type) const;

  // Stacks of a type in insertion order; empty for an unknown type.
  const std::vector<ResourceStack>& stacks(const std::string& resource_type) const;

  // Resource types that currently hold stacks, sorted.
  std::vector<std::string> resource_types() const;

  // Adds every stack of `other` into this inventory.
  void merge(const Inventory& other);

  bool empty() const { return by_type_.empty(); }

  const std::unordered_map<std::string, std::vector<ResourceStack>>& raw() const { return by_type_; }

  friend bool operator==(const Inventory& a, const Inventory& b) { return a.by_type_ == b.by_type_; }
  friend bool operator!=(const Inventory& a, const Inventory& b) { return !(a == b); }

 private:
  friend class InventoryBuilder;

  std::unordered_map<std::string, std::vector<ResourceStack>> by_type_;
};

// Restores an Inventory from externally persisted stacks without merging or
// dropping anything, so that session-state validation can inspect the result.
class InventoryBuilder {
 public:
  InventoryBuilder& put(const std::string& resource_type, const std::string& material_id, int quantity);
  Inventory build() const { return inv_; }

 private:
  Inventory inv_;
};

} // namespace walkforage

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "walkforage/core/craftable.h"
#include "walkforage/core/inventory.h"
#include "walkforage/core/tech.h"

namespace walkforage {

class ContentDB;

struct SelectionEntry {
  std::string material_id;
  int quantity{0};
};

// Player-chosen materials, keyed by resource type.
using Selection = std::unordered_map<std::string, std::vector<SelectionEntry>>;

// One resource type that must be paid exactly.
struct SpendRequirement {
  std::string resource_type;
  int quantity{0};
  bool requires_toolstone{false};
};

std::vector<SpendRequirement> spend_requirements(const std::vector<ResourceCost>& cost);
std::vector<SpendRequirement> spend_requirements(const std::vector<MaterialSlot>& slots);

struct UsedMaterial {
  std::string resource_type;
  std::string material_id;
  int quantity{0};
};

enum class SpendErrorKind {
  None,
  NoSelection,
  WrongQuantitySelected,
  InsufficientMaterial,
  InvalidMaterial,
  AlreadyUnlocked,
  MissingPrerequisites,
  UnknownTarget,
  WrongComponentSelection,
};

const char* spend_error_kind_label(SpendErrorKind k);

struct SpendError {
  SpendErrorKind kind{SpendErrorKind::None};

  // Filled where meaningful for the kind.
  std::string resource_type;
  std::string material_id;
  int have{0};
  int needed{0};
  std::vector<std::string> missing_prerequisites;

  std::string message;
};

struct SpendResult {
  SpendError error;

  // Tech or craftable id, set by Session on success.
  std::string granted_id;

  // Debited entries, aggregated per (type, material), in selection order.
  std::vector<UsedMaterial> consumed;

  bool ok() const { return error.kind == SpendErrorKind::None; }
};

// Validates `selection` against `requirements` and debits `inventory` only if
// every check passes. On failure the inventory is left exactly as it was.
//
// Check order: NoSelection, WrongQuantitySelected, InvalidMaterial (only with
// a ContentDB), InsufficientMaterial. Selected types that are not required are
// ignored.
SpendResult attempt_spend(const std::vector<SpendRequirement>& requirements, const Selection& selection,
                          Inventory& inventory, const ContentDB* content = nullptr);

// Sum of the type's stacks whose material carries the toolstone flag.
int toolstone_total(const Inventory& inventory, const ContentDB& content, const std::string& resource_type);

} // namespace walkforage

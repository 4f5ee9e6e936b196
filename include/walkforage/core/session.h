#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "walkforage/core/consumption.h"
#include "walkforage/core/dependency_graph.h"
#include "walkforage/core/inventory.h"
#include "walkforage/core/quality.h"

namespace walkforage {

class ContentDB;

// One crafted tool or component instance.
struct OwnedItem {
  std::string instance_id;
  std::string craftable_id;
  double quality{0.0};
  QualityTier tier{QualityTier::Poor};
  CraftableKind kind{CraftableKind::Tool};
  // Raw materials consumed to make it, in selection order.
  std::vector<UsedMaterial> materials;
};

// Everything a player owns. Persisted by the session layer.
struct SessionState {
  Inventory inventory;
  IdSet unlocked_techs;
  std::vector<OwnedItem> owned_tools;
  std::vector<OwnedItem> owned_components;

  // Sequence number for the next "<craftable_id>#<seq>" instance id.
  int next_instance_seq{1};
};

struct SessionConfig {
  QualityTuning quality;

  // Successful unlocks and crafts at Info, rejections at Debug.
  bool log_transactions{true};
};

struct ResourceShortfall {
  std::string resource_type;
  int have{0};
  int needed{0};
};

// Pre-selection hint for the UI, built from per-type inventory totals.
// A positive answer does not guarantee that a commit will succeed.
struct AvailabilityCheck {
  bool can_proceed{false};
  bool already_unlocked{false};

  // Tech ids (for a craftable: its required tech).
  std::vector<std::string> missing_prerequisites;
  std::vector<ResourceShortfall> missing_resources;

  // Craftables only; quantity is the shortfall.
  std::vector<ItemRequirement> missing_tools;
  std::vector<ItemRequirement> missing_components;
};

struct CraftSelection {
  Selection materials;

  // Owned component instances to consume, exactly matching the recipe.
  std::vector<std::string> component_instance_ids;
};

struct CraftResult {
  SpendResult spend;

  // The new instance (valid when ok()).
  OwnedItem item;

  bool ok() const { return spend.ok(); }
};

// A single player's mutable game state on top of the shared static content.
//
// Session is the only writer of its state; every change goes through the
// member functions below and leaves the state untouched when it fails.
class Session {
 public:
  // Throws std::invalid_argument for a null content pointer and
  // std::runtime_error if `state` does not match the content.
  explicit Session(std::shared_ptr<const ContentDB> content, SessionState state = {}, SessionConfig cfg = {});

  const ContentDB& content() const { return *content_; }
  const SessionState& state() const { return state_; }
  const Inventory& inventory() const { return state_.inventory; }
  const SessionConfig& config() const { return cfg_; }

  // Gathering entry point. Returns false (and changes nothing) for an unknown
  // type or material, or a non-positive quantity.
  bool add_resource(const std::string& resource_type, const std::string& material_id, int quantity);

  // --- Techs ---
  std::optional<bool> is_tech_available(const std::string& tech_id) const;
  std::vector<std::string> available_techs() const;
  std::vector<std::string> missing_tech_prerequisites(const std::string& tech_id) const;
  bool is_tech_unlocked(const std::string& tech_id) const;
  const IdSet& unlocked_set() const { return state_.unlocked_techs; }

  std::optional<AvailabilityCheck> check_tech(const std::string& tech_id) const;

  // Checks AlreadyUnlocked, UnknownTarget and MissingPrerequisites, then pays
  // the cost through attempt_spend().
  SpendResult unlock_tech(const std::string& tech_id, const Selection& selection);

  // --- Crafting ---

  // Craftables whose required tech is unlocked, declaration order.
  std::vector<std::string> available_recipes() const;

  // Required tech unlocked and every required tool and component owned at
  // least once (the craftable graph against owned_ids()). Owning the item
  // itself does not make it unavailable. nullopt for an unknown id.
  std::optional<bool> is_craftable_available(const std::string& craftable_id) const;
  std::vector<std::string> available_craftables() const;

  // Craftable ids of every owned tool and component.
  IdSet owned_ids() const;

  std::optional<AvailabilityCheck> check_craft(const std::string& craftable_id) const;
  CraftResult craft(const std::string& craftable_id, const CraftSelection& selection);

  int owned_count(const std::string& craftable_id) const;

  // Distinct craftable ids of owned tools, sorted.
  std::vector<std::string> owned_tool_ids() const;

 private:
  std::string next_instance_id(const std::string& craftable_id);
  bool instance_exists(const std::string& instance_id) const;

  std::shared_ptr<const ContentDB> content_;
  SessionState state_;
  SessionConfig cfg_;
};

} // namespace walkforage

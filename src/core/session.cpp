#include "walkforage/core/session.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "walkforage/core/content_db.h"
#include "walkforage/core/state_validation.h"
#include "walkforage/util/log.h"
#include "walkforage/util/strings.h"

namespace walkforage {

namespace {

SpendResult reject(SpendErrorKind kind, std::string message) {
  SpendResult r;
  r.error.kind = kind;
  r.error.message = std::move(message);
  return r;
}

std::string describe(const std::vector<UsedMaterial>& used) {
  std::vector<std::string> parts;
  for (const auto& u : used) parts.push_back(std::to_string(u.quantity) + " " + u.material_id);
  return parts.empty() ? "nothing" : join(parts);
}

} // namespace

Session::Session(std::shared_ptr<const ContentDB> content, SessionState state, SessionConfig cfg)
    : content_(std::move(content)), state_(std::move(state)), cfg_(cfg) {
  if (!content_) throw std::invalid_argument("Session requires content");

  const auto errors = validate_session_state(*content_, state_);
  if (!errors.empty()) {
    std::string msg = "Invalid session state: " + errors.front();
    if (errors.size() > 1) msg += " (and " + std::to_string(errors.size() - 1) + " more)";
    throw std::runtime_error(msg);
  }
}

bool Session::add_resource(const std::string& resource_type, const std::string& material_id, int quantity) {
  if (quantity <= 0) return false;
  if (!content_->find_material(resource_type, material_id)) {
    log::debug("Ignoring unknown material " + resource_type + "/" + material_id);
    return false;
  }
  state_.inventory.add(resource_type, material_id, quantity);
  return true;
}

std::optional<bool> Session::is_tech_available(const std::string& tech_id) const {
  return content_->tech_graph().is_available(tech_id, state_.unlocked_techs);
}

std::vector<std::string> Session::available_techs() const {
  return content_->tech_graph().available_set(state_.unlocked_techs);
}

std::vector<std::string> Session::missing_tech_prerequisites(const std::string& tech_id) const {
  return content_->tech_graph().missing_prerequisites(tech_id, state_.unlocked_techs);
}

bool Session::is_tech_unlocked(const std::string& tech_id) const {
  return state_.unlocked_techs.find(tech_id) != state_.unlocked_techs.end();
}

std::optional<AvailabilityCheck> Session::check_tech(const std::string& tech_id) const {
  const TechDef* t = content_->find_tech(tech_id);
  if (!t) return std::nullopt;

  AvailabilityCheck out;
  out.already_unlocked = is_tech_unlocked(tech_id);
  out.missing_prerequisites = missing_tech_prerequisites(tech_id);
  for (const auto& c : t->cost) {
    const int have = state_.inventory.total(c.resource_type);
    if (have < c.quantity) out.missing_resources.push_back(ResourceShortfall{c.resource_type, have, c.quantity});
  }
  out.can_proceed = !out.already_unlocked && out.missing_prerequisites.empty() && out.missing_resources.empty();
  return out;
}

SpendResult Session::unlock_tech(const std::string& tech_id, const Selection& selection) {
  const TechDef* t = content_->find_tech(tech_id);
  SpendResult r;
  if (is_tech_unlocked(tech_id)) {
    r = reject(SpendErrorKind::AlreadyUnlocked, "Tech '" + tech_id + "' is already unlocked");
  } else if (!t) {
    r = reject(SpendErrorKind::UnknownTarget, "Unknown tech '" + tech_id + "'");
  } else if (auto missing = missing_tech_prerequisites(tech_id); !missing.empty()) {
    r = reject(SpendErrorKind::MissingPrerequisites, "Tech '" + tech_id + "' requires " + join(missing));
    r.error.missing_prerequisites = std::move(missing);
  } else {
    r = attempt_spend(spend_requirements(t->cost), selection, state_.inventory, content_.get());
  }

  if (!r.ok()) {
    if (cfg_.log_transactions) log::debug("Unlock rejected: " + r.error.message);
    return r;
  }

  state_.unlocked_techs.insert(tech_id);
  r.granted_id = tech_id;
  if (cfg_.log_transactions) log::info("Unlocked " + t->name + " for " + describe(r.consumed));
  return r;
}

std::vector<std::string> Session::available_recipes() const {
  std::vector<std::string> out;
  for (const auto& c : content_->craftables()) {
    if (c.required_tech.empty() || is_tech_unlocked(c.required_tech)) out.push_back(c.id);
  }
  return out;
}

std::optional<bool> Session::is_craftable_available(const std::string& craftable_id) const {
  const CraftableDef* c = content_->find_craftable(craftable_id);
  if (!c) return std::nullopt;
  if (!c->required_tech.empty() && !is_tech_unlocked(c->required_tech)) return false;
  return content_->craftable_graph().missing_prerequisites(craftable_id, owned_ids()).empty();
}

std::vector<std::string> Session::available_craftables() const {
  const IdSet owned = owned_ids();
  std::vector<std::string> out;
  for (const auto& c : content_->craftables()) {
    if (!c.required_tech.empty() && !is_tech_unlocked(c.required_tech)) continue;
    if (content_->craftable_graph().missing_prerequisites(c.id, owned).empty()) out.push_back(c.id);
  }
  return out;
}

IdSet Session::owned_ids() const {
  IdSet out;
  for (const auto& t : state_.owned_tools) out.insert(t.craftable_id);
  for (const auto& c : state_.owned_components) out.insert(c.craftable_id);
  return out;
}

std::optional<AvailabilityCheck> Session::check_craft(const std::string& craftable_id) const {
  const CraftableDef* c = content_->find_craftable(craftable_id);
  if (!c) return std::nullopt;

  AvailabilityCheck out;
  if (!c->required_tech.empty() && !is_tech_unlocked(c->required_tech)) {
    out.missing_prerequisites.push_back(c->required_tech);
  }
  for (const auto& req : c->required_tools) {
    const int have = owned_count(req.id);
    if (have < req.quantity) out.missing_tools.push_back(ItemRequirement{req.id, req.quantity - have});
  }
  for (const auto& req : c->required_components) {
    const int have = owned_count(req.id);
    if (have < req.quantity) out.missing_components.push_back(ItemRequirement{req.id, req.quantity - have});
  }
  for (const auto& slot : c->materials) {
    const int have = slot.requires_toolstone ? toolstone_total(state_.inventory, *content_, slot.resource_type)
                                             : state_.inventory.total(slot.resource_type);
    if (have < slot.quantity) out.missing_resources.push_back(ResourceShortfall{slot.resource_type, have, slot.quantity});
  }
  out.can_proceed = out.missing_prerequisites.empty() && out.missing_tools.empty() &&
                    out.missing_components.empty() && out.missing_resources.empty();
  return out;
}

CraftResult Session::craft(const std::string& craftable_id, const CraftSelection& selection) {
  CraftResult out;
  const auto rejected = [&](SpendErrorKind kind, std::string message) {
    out.spend = reject(kind, std::move(message));
    if (cfg_.log_transactions) log::debug("Craft rejected: " + out.spend.error.message);
    return out;
  };

  const CraftableDef* c = content_->find_craftable(craftable_id);
  if (!c) return rejected(SpendErrorKind::UnknownTarget, "Unknown craftable '" + craftable_id + "'");

  if (!c->required_tech.empty() && !is_tech_unlocked(c->required_tech)) {
    CraftResult r = rejected(SpendErrorKind::MissingPrerequisites,
                             "'" + craftable_id + "' requires tech '" + c->required_tech + "'");
    r.spend.error.missing_prerequisites.push_back(c->required_tech);
    return r;
  }

  std::vector<std::string> missing_tools;
  for (const auto& req : c->required_tools) {
    if (owned_count(req.id) < req.quantity) missing_tools.push_back(req.id);
  }
  if (!missing_tools.empty()) {
    CraftResult r = rejected(SpendErrorKind::MissingPrerequisites,
                             "'" + craftable_id + "' requires tools " + join(missing_tools));
    r.spend.error.missing_prerequisites = std::move(missing_tools);
    return r;
  }

  // Selected component instances must match the recipe exactly.
  std::unordered_map<std::string, int> wanted;
  for (const auto& req : c->required_components) wanted[req.id] += req.quantity;
  std::vector<std::size_t> picked;
  for (const auto& iid : selection.component_instance_ids) {
    const auto it = std::find_if(state_.owned_components.begin(), state_.owned_components.end(),
                                 [&](const OwnedItem& o) { return o.instance_id == iid; });
    if (it == state_.owned_components.end()) {
      return rejected(SpendErrorKind::WrongComponentSelection, "Component instance '" + iid + "' is not owned");
    }
    const auto idx = static_cast<std::size_t>(it - state_.owned_components.begin());
    if (std::find(picked.begin(), picked.end(), idx) != picked.end()) {
      return rejected(SpendErrorKind::WrongComponentSelection, "Component instance '" + iid + "' selected twice");
    }
    picked.push_back(idx);
    if (--wanted[it->craftable_id] < 0) {
      return rejected(SpendErrorKind::WrongComponentSelection,
                      "'" + craftable_id + "' does not need another '" + it->craftable_id + "'");
    }
  }
  for (const auto& [id, left] : wanted) {
    if (left > 0) {
      return rejected(SpendErrorKind::WrongComponentSelection,
                      "'" + craftable_id + "' needs " + std::to_string(left) + " more '" + id + "'");
    }
  }

  out.spend = attempt_spend(spend_requirements(c->materials), selection.materials, state_.inventory, content_.get());
  if (!out.spend.ok()) {
    if (cfg_.log_transactions) log::debug("Craft rejected: " + out.spend.error.message);
    return out;
  }

  // Remove consumed components, highest index first so earlier indices stay valid.
  std::sort(picked.rbegin(), picked.rend());
  for (const std::size_t idx : picked) {
    state_.owned_components.erase(state_.owned_components.begin() + static_cast<std::ptrdiff_t>(idx));
  }

  out.item.craftable_id = craftable_id;
  out.item.instance_id = next_instance_id(craftable_id);
  out.item.kind = c->kind;
  out.item.materials = out.spend.consumed;
  out.item.quality = score_craftable(*content_, *c, out.spend.consumed, cfg_.quality);
  out.item.tier = quality_tier(out.item.quality, cfg_.quality);
  out.spend.granted_id = craftable_id;

  if (c->kind == CraftableKind::Tool) {
    state_.owned_tools.push_back(out.item);
  } else {
    state_.owned_components.push_back(out.item);
  }

  if (cfg_.log_transactions) {
    log::info("Crafted " + out.item.instance_id + " (" + quality_tier_label(out.item.tier) + ") from " +
              describe(out.spend.consumed));
  }
  return out;
}

int Session::owned_count(const std::string& craftable_id) const {
  const auto match = [&](const OwnedItem& o) { return o.craftable_id == craftable_id; };
  return static_cast<int>(std::count_if(state_.owned_tools.begin(), state_.owned_tools.end(), match) +
                          std::count_if(state_.owned_components.begin(), state_.owned_components.end(), match));
}

std::vector<std::string> Session::owned_tool_ids() const {
  std::vector<std::string> out;
  for (const auto& t : state_.owned_tools) out.push_back(t.craftable_id);
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

bool Session::instance_exists(const std::string& instance_id) const {
  const auto match = [&](const OwnedItem& o) { return o.instance_id == instance_id; };
  return std::any_of(state_.owned_tools.begin(), state_.owned_tools.end(), match) ||
         std::any_of(state_.owned_components.begin(), state_.owned_components.end(), match);
}

std::string Session::next_instance_id(const std::string& craftable_id) {
  std::string id;
  do {
    id = craftable_id + "#" + std::to_string(state_.next_instance_seq++);
  } while (instance_exists(id));
  return id;
}

} // namespace walkforage

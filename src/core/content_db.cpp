#include "walkforage/core/content_db.h"

#include <utility>

#include "walkforage/core/content_validation.h"
#include "walkforage/util/log.h"

namespace walkforage {

namespace {

std::string material_key(const std::string& type, const std::string& id) { return type + "/" + id; }

std::string summarize(const std::vector<ContentIssue>& issues) {
  std::string msg = "Content integrity check failed with " + std::to_string(issues.size()) + " error(s)";
  if (!issues.empty()) msg += ": " + issues.front().message;
  if (issues.size() > 1) msg += " (and " + std::to_string(issues.size() - 1) + " more)";
  return msg;
}

} // namespace

ContentDB::ContentDB(ContentTables tables) : tables_(std::move(tables)) {
  for (const auto& t : tables_.resource_types) registry_.add(t);

  for (std::size_t i = 0; i < tables_.techs.size(); ++i) tech_index_.emplace(tables_.techs[i].id, i);
  for (std::size_t i = 0; i < tables_.craftables.size(); ++i) craftable_index_.emplace(tables_.craftables[i].id, i);
  for (std::size_t i = 0; i < tables_.materials.size(); ++i) {
    const auto& m = tables_.materials[i];
    material_index_.emplace(material_key(m.resource_type, m.id), i);
  }

  std::vector<DependencyNode> tech_nodes;
  tech_nodes.reserve(tables_.techs.size());
  for (const auto& t : tables_.techs) tech_nodes.push_back(DependencyNode{t.id, t.prerequisites});
  tech_graph_ = DependencyGraph(std::move(tech_nodes));

  std::vector<DependencyNode> craft_nodes;
  craft_nodes.reserve(tables_.craftables.size());
  for (const auto& c : tables_.craftables) craft_nodes.push_back(DependencyNode{c.id, c.requirement_ids()});
  craftable_graph_ = DependencyGraph(std::move(craft_nodes));
}

const TechDef* ContentDB::find_tech(const std::string& id) const {
  const auto it = tech_index_.find(id);
  return it == tech_index_.end() ? nullptr : &tables_.techs[it->second];
}

const CraftableDef* ContentDB::find_craftable(const std::string& id) const {
  const auto it = craftable_index_.find(id);
  return it == craftable_index_.end() ? nullptr : &tables_.craftables[it->second];
}

const MaterialDef* ContentDB::find_material(const std::string& resource_type, const std::string& material_id) const {
  const auto it = material_index_.find(material_key(resource_type, material_id));
  return it == material_index_.end() ? nullptr : &tables_.materials[it->second];
}

std::vector<const MaterialDef*> ContentDB::materials_of(const std::string& resource_type) const {
  std::vector<const MaterialDef*> out;
  for (const auto& m : tables_.materials) {
    if (m.resource_type == resource_type) out.push_back(&m);
  }
  return out;
}

std::vector<const TechDef*> ContentDB::techs_in_era(const std::string& era) const {
  std::vector<const TechDef*> out;
  for (const auto& t : tables_.techs) {
    if (t.era == era) out.push_back(&t);
  }
  return out;
}

ContentIntegrityError::ContentIntegrityError(std::vector<ContentIssue> issues)
    : std::runtime_error(summarize(issues)),
      issues_(std::make_shared<const std::vector<ContentIssue>>(std::move(issues))) {}

std::shared_ptr<const ContentDB> build_content_db(ContentTables tables) {
  const auto issues = validate_content_detailed(tables);

  std::vector<ContentIssue> errors;
  for (const auto& is : issues) {
    if (is.severity == ContentIssueSeverity::Error) {
      log::error("Content: " + is.message + " [" + is.code + "]");
      errors.push_back(is);
    } else {
      log::warn("Content: " + is.message + " [" + is.code + "]");
    }
  }
  if (!errors.empty()) throw ContentIntegrityError(std::move(errors));

  auto db = std::make_shared<const ContentDB>(std::move(tables));
  log::info("Content loaded: " + std::to_string(db->resource_types().size()) + " resource types, " +
            std::to_string(db->materials().size()) + " materials, " + std::to_string(db->techs().size()) +
            " techs, " + std::to_string(db->craftables().size()) + " craftables");
  return db;
}

} // namespace walkforage

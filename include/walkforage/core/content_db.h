#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "walkforage/core/content_issue.h"
#include "walkforage/core/craftable.h"
#include "walkforage/core/dependency_graph.h"
#include "walkforage/core/resources.h"
#include "walkforage/core/tech.h"

namespace walkforage {

// Raw content tables, exactly as authored (duplicates and dangling ids included).
// This is what content validation inspects.
struct ContentTables {
  std::vector<ResourceTypeDef> resource_types;
  std::vector<MaterialDef> materials;
  std::vector<TechDef> techs;
  std::vector<CraftableDef> craftables;
};

// Immutable, indexed view of the static content.
//
// Built once at startup and shared read-only (typically through
// std::shared_ptr<const ContentDB>). Declaration order of every table is
// preserved; lookups go through hash maps built from those lists.
class ContentDB {
 public:
  // Indexes the tables without validating them. Duplicate ids keep the first
  // definition. Prefer build_content_db() for anything user-facing.
  explicit ContentDB(ContentTables tables);

  const ResourceTypeRegistry& resource_types() const { return registry_; }

  const std::vector<TechDef>& techs() const { return tables_.techs; }
  const std::vector<CraftableDef>& craftables() const { return tables_.craftables; }
  const std::vector<MaterialDef>& materials() const { return tables_.materials; }

  const TechDef* find_tech(const std::string& id) const;
  const CraftableDef* find_craftable(const std::string& id) const;
  const MaterialDef* find_material(const std::string& resource_type, const std::string& material_id) const;

  // Materials of one type, declaration order.
  std::vector<const MaterialDef*> materials_of(const std::string& resource_type) const;

  std::vector<const TechDef*> techs_in_era(const std::string& era) const;

  // Prerequisite graph over techs.
  const DependencyGraph& tech_graph() const { return tech_graph_; }

  // Requirement graph over craftables (required tools + required components).
  const DependencyGraph& craftable_graph() const { return craftable_graph_; }

 private:
  ContentTables tables_;
  ResourceTypeRegistry registry_;

  std::unordered_map<std::string, std::size_t> tech_index_;
  std::unordered_map<std::string, std::size_t> craftable_index_;
  // Keyed by "<type>/<material id>".
  std::unordered_map<std::string, std::size_t> material_index_;

  DependencyGraph tech_graph_;
  DependencyGraph craftable_graph_;
};

// Thrown when content fails validation with at least one error-severity issue.
class ContentIntegrityError : public std::runtime_error {
 public:
  explicit ContentIntegrityError(std::vector<ContentIssue> issues);

  // Error-severity issues only.
  const std::vector<ContentIssue>& issues() const { return *issues_; }

 private:
  std::shared_ptr<const std::vector<ContentIssue>> issues_;
};

// Validates the tables and returns the shared, immutable ContentDB.
// Errors are logged and thrown as ContentIntegrityError; warnings are logged.
std::shared_ptr<const ContentDB> build_content_db(ContentTables tables);

} // namespace walkforage

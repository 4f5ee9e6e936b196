#pragma once

#include <memory>
#include <string>

#include "walkforage/core/content_db.h"
#include "walkforage/util/json.h"

namespace walkforage {

// Builds raw tables from a parsed content document with top-level arrays
// "resource_types", "materials", "techs" and "craftables" (each optional).
// Throws std::runtime_error on structural problems (wrong JSON types, unknown
// craftable kind). Referential checks are left to content validation.
ContentTables parse_content_tables(const json::Value& root);

ContentTables load_content_tables_from_file(const std::string& path);

// Load + validate. Throws ContentIntegrityError if the content has errors.
std::shared_ptr<const ContentDB> load_content_db_from_file(const std::string& path);

} // namespace walkforage

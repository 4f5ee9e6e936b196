#include "walkforage/core/content_loader.h"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "walkforage/util/file_io.h"
#include "walkforage/util/log.h"

namespace walkforage {
namespace {

std::string str_or(const json::Value& o, const char* key, const std::string& def) {
  const auto* v = o.find(key);
  return v ? v->as_string(key) : def;
}

int int_or(const json::Value& o, const char* key, int def) {
  const auto* v = o.find(key);
  if (!v) return def;
  const std::int64_t n = v->as_int(key);
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
    throw std::runtime_error(std::string("Integer out of range for '") + key + "'");
  }
  return static_cast<int>(n);
}

std::vector<std::string> string_list(const json::Value& o, const char* key) {
  std::vector<std::string> out;
  if (const auto* v = o.find(key)) {
    for (const auto& s : v->as_array(key)) out.push_back(s.as_string(key));
  }
  return out;
}

std::unordered_map<std::string, double> number_map(const json::Value& v, const char* what) {
  std::unordered_map<std::string, double> out;
  for (const auto& [k, n] : v.as_object(what)) out[k] = n.as_number(what);
  return out;
}

const json::Array& table(const json::Value& root, const char* key) {
  static const json::Array kEmpty;
  const auto* v = root.find(key);
  return v ? v->as_array(key) : kEmpty;
}

ResourceTypeDef parse_resource_type(const json::Value& o) {
  ResourceTypeDef t;
  t.id = o.as_object("resource type").at("id").as_string("resource_types[].id");
  t.singular_name = str_or(o, "singular_name", t.id);
  t.plural_name = str_or(o, "plural_name", t.singular_name);
  t.icon = str_or(o, "icon", "");
  t.has_toolstone = o.bool_or("has_toolstone", false);

  if (const auto* props = o.find("properties")) {
    for (const auto& pv : props->as_array("properties")) {
      PropertyDef p;
      p.id = pv.as_object("property").at("id").as_string("properties[].id");
      p.abbreviation = str_or(pv, "abbreviation", p.id.substr(0, 1));
      p.display_name = str_or(pv, "display_name", p.id);
      p.min_value = pv.number_or("min", p.min_value);
      p.max_value = pv.number_or("max", p.max_value);
      t.property_schema.push_back(std::move(p));
    }
  }
  if (const auto* w = o.find("default_quality_weights")) {
    t.default_quality_weights = number_map(*w, "default_quality_weights");
  }
  return t;
}

MaterialDef parse_material(const json::Value& o) {
  MaterialDef m;
  m.id = o.as_object("material").at("id").as_string("materials[].id");
  m.resource_type = str_or(o, "type", "");
  m.name = str_or(o, "name", m.id);
  m.category = str_or(o, "category", "");
  m.description = str_or(o, "description", "");
  m.color = str_or(o, "color", "");
  m.rarity = o.number_or("rarity", 0.0);
  m.toolstone = o.bool_or("toolstone", false);
  if (const auto* p = o.find("properties")) m.properties = number_map(*p, "properties");
  return m;
}

TechDef parse_tech(const json::Value& o) {
  TechDef t;
  t.id = o.as_object("tech").at("id").as_string("techs[].id");
  t.name = str_or(o, "name", t.id);
  t.era = str_or(o, "era", "");
  t.description = str_or(o, "description", "");
  t.prerequisites = string_list(o, "prerequisites");
  t.unlocks = string_list(o, "unlocks");
  t.enables_recipes = string_list(o, "enables_recipes");

  if (const auto* cv = o.find("cost")) {
    for (const auto& c : cv->as_array("cost")) {
      ResourceCost rc;
      rc.resource_type = c.as_object("cost entry").at("type").as_string("cost[].type");
      rc.quantity = int_or(c, "quantity", 0);
      t.cost.push_back(std::move(rc));
    }
  }
  return t;
}

std::vector<ItemRequirement> requirement_list(const json::Value& o, const char* key) {
  std::vector<ItemRequirement> out;
  if (const auto* v = o.find(key)) {
    for (const auto& r : v->as_array(key)) {
      ItemRequirement req;
      // Bare strings are shorthand for quantity 1.
      if (r.is_string()) {
        req.id = r.as_string(key);
      } else {
        req.id = r.as_object(key).at("id").as_string(key);
        req.quantity = int_or(r, "quantity", 1);
      }
      out.push_back(std::move(req));
    }
  }
  return out;
}

CraftableDef parse_craftable(const json::Value& o) {
  CraftableDef c;
  c.id = o.as_object("craftable").at("id").as_string("craftables[].id");
  const std::string kind = str_or(o, "kind", "tool");
  if (!parse_craftable_kind(kind, c.kind)) {
    throw std::runtime_error("Craftable '" + c.id + "' has unknown kind '" + kind + "'");
  }
  c.name = str_or(o, "name", c.id);
  c.category = str_or(o, "category", "");
  c.era = str_or(o, "era", "");
  c.description = str_or(o, "description", "");
  c.required_tech = str_or(o, "required_tech", "");
  c.required_tools = requirement_list(o, "required_tools");
  c.required_components = requirement_list(o, "required_components");

  if (const auto* mv = o.find("materials")) {
    for (const auto& s : mv->as_array("materials")) {
      MaterialSlot slot;
      slot.resource_type = s.as_object("material slot").at("type").as_string("materials[].type");
      slot.quantity = int_or(s, "quantity", 0);
      slot.requires_toolstone = s.bool_or("requires_toolstone", false);
      c.materials.push_back(std::move(slot));
    }
  }
  if (const auto* wv = o.find("quality_weights")) {
    for (const auto& [type, w] : wv->as_object("quality_weights")) {
      c.quality_weights[type] = number_map(w, "quality_weights");
    }
  }
  return c;
}

} // namespace

ContentTables parse_content_tables(const json::Value& root) {
  root.as_object("content root");

  ContentTables t;
  for (const auto& v : table(root, "resource_types")) t.resource_types.push_back(parse_resource_type(v));
  for (const auto& v : table(root, "materials")) t.materials.push_back(parse_material(v));
  for (const auto& v : table(root, "techs")) t.techs.push_back(parse_tech(v));
  for (const auto& v : table(root, "craftables")) t.craftables.push_back(parse_craftable(v));
  return t;
}

ContentTables load_content_tables_from_file(const std::string& path) {
  const auto txt = read_text_file(path);
  try {
    return parse_content_tables(json::parse(txt));
  } catch (const std::out_of_range&) {
    // std::map::at on a missing "id"/"type" member.
    throw std::runtime_error("Content file '" + path + "' is missing a required member");
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Content file '" + path + "': " + e.what());
  }
}

std::shared_ptr<const ContentDB> load_content_db_from_file(const std::string& path) {
  log::debug("Loading content from " + resolve_data_path(path));
  return build_content_db(load_content_tables_from_file(path));
}

} // namespace walkforage

#include "test.h"

#include <iostream>
#include <stdexcept>

#include "walkforage/core/content_loader.h"
#include "walkforage/util/json.h"

using namespace walkforage;

#define WF_ASSERT(cond)                                                                                                \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                         \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

namespace {

bool parse_throws(const std::string& text) {
  try {
    parse_content_tables(json::parse(text));
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

} // namespace

int test_content_loader() {
  int failed = 0;

  {
    const auto db = load_content_db_from_file(walkforage_test::kLithicContent);
    WF_ASSERT(db->resource_types().size() == 3);
    WF_ASSERT(db->techs().size() == 8);
    WF_ASSERT(db->craftables().size() == 12);

    // Declaration order is kept.
    WF_ASSERT(db->techs().front().id == "basic_knapping");
    WF_ASSERT(db->resource_types().ids().front() == "stone");

    const TechDef* knap = db->find_tech("basic_knapping");
    WF_ASSERT(knap != nullptr);
    WF_ASSERT(knap->prerequisites.empty());
    WF_ASSERT(knap->cost.size() == 2);
    WF_ASSERT(knap->cost[0].resource_type == "stone" && knap->cost[0].quantity == 10);
    WF_ASSERT(knap->cost[1].resource_type == "food" && knap->cost[1].quantity == 5);

    const MaterialDef* flint = db->find_material("stone", "flint");
    WF_ASSERT(flint != nullptr);
    WF_ASSERT(flint->toolstone);
    WF_ASSERT(flint->properties.at("hardness") == 7);
    WF_ASSERT(db->find_material("wood", "flint") == nullptr);
    WF_ASSERT(db->materials_of("wood").size() == 5);

    const CraftableDef* knife = db->find_craftable("stone_knife");
    WF_ASSERT(knife != nullptr);
    WF_ASSERT(knife->kind == CraftableKind::Tool);
    WF_ASSERT(knife->required_tech == "hafting");
    WF_ASSERT(knife->required_components.size() == 2);
    WF_ASSERT(knife->materials.size() == 1 && knife->materials[0].requires_toolstone);
    const auto req = knife->requirement_ids();
    WF_ASSERT(req.size() == 3 && req[0] == "hammerstone");

    WF_ASSERT(db->find_craftable("crude_handle")->kind == CraftableKind::Component);
    WF_ASSERT(db->find_tech("nope") == nullptr);
    WF_ASSERT(db->find_craftable("nope") == nullptr);

    const auto upper = db->techs_in_era("upper_paleolithic");
    WF_ASSERT(upper.size() == 2);
    WF_ASSERT(upper[0]->id == "blade_technology");
    WF_ASSERT(db->techs_in_era("bronze_age").empty());

    const ResourceTypeDef* stone = db->resource_types().find("stone");
    WF_ASSERT(stone && stone->has_toolstone);
    WF_ASSERT(stone->property_schema.size() == 3);
    WF_ASSERT(stone->find_property("workability") != nullptr);
    WF_ASSERT(db->resource_types().find("food")->property_schema.empty());
  }

  {
    // Minimal document: optional members fall back to defaults.
    const auto t = parse_content_tables(json::parse(R"({
      "techs": [{"id": "a"}],
      "craftables": [{"id": "c", "required_tools": ["t"]}]
    })"));
    WF_ASSERT(t.resource_types.empty());
    WF_ASSERT(t.techs.size() == 1 && t.techs[0].name == "a");
    WF_ASSERT(t.craftables[0].kind == CraftableKind::Tool);
    WF_ASSERT(t.craftables[0].required_tools.size() == 1);
    WF_ASSERT(t.craftables[0].required_tools[0].quantity == 1);
  }

  // Structural problems are exceptions, referential ones are left to validation.
  WF_ASSERT(parse_throws("[]"));
  WF_ASSERT(parse_throws(R"({"techs": {}})"));
  WF_ASSERT(parse_throws(R"({"techs": [{"name": "no id"}]})"));
  WF_ASSERT(parse_throws(R"({"craftables": [{"id": "x", "kind": "weapon"}]})"));
  WF_ASSERT(parse_throws(R"({"techs": [{"id": "x", "cost": [{"type": "stone", "quantity": 1.5}]}]})"));
  WF_ASSERT(!parse_throws(R"({"techs": [{"id": "x", "prerequisites": ["ghost"]}]})"));

  {
    bool threw = false;
    try {
      load_content_tables_from_file("data/content/does_not_exist.json");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    WF_ASSERT(threw);
  }

  return failed;
}

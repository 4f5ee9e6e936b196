#include "test.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "walkforage/core/content_loader.h"
#include "walkforage/core/session.h"
#include "walkforage/util/log.h"

using namespace walkforage;

#define WF_ASSERT(cond)                                                                                                \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                         \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

namespace {

Selection pick(const std::string& type, const std::string& material, int qty) {
  Selection s;
  s[type] = {SelectionEntry{material, qty}};
  return s;
}

Selection pick2(const std::string& t1, const std::string& m1, int q1, const std::string& t2, const std::string& m2,
                int q2) {
  Selection s = pick(t1, m1, q1);
  s[t2].push_back(SelectionEntry{m2, q2});
  return s;
}

} // namespace

int test_session() {
  int failed = 0;

  const auto db = load_content_db_from_file(walkforage_test::kLithicContent);

  {
    Session s(db);
    WF_ASSERT(s.available_techs().size() == 1);
    WF_ASSERT(s.available_techs()[0] == "basic_knapping");
    WF_ASSERT(s.is_tech_available("grinding") == std::optional<bool>(false));
    WF_ASSERT(!s.is_tech_available("warp_drive").has_value());

    WF_ASSERT(s.add_resource("stone", "granite", 20));
    WF_ASSERT(s.add_resource("food", "berries", 10));
    WF_ASSERT(!s.add_resource("stone", "moonrock", 5));
    WF_ASSERT(!s.add_resource("stone", "granite", 0));
    WF_ASSERT(!s.add_resource("clay", "red", 1));
    WF_ASSERT(s.inventory().total("stone") == 20);

    // Prerequisites are checked before any payment.
    const Inventory before = s.inventory();
    auto r = s.unlock_tech("grinding", pick("stone", "granite", 15));
    WF_ASSERT(r.error.kind == SpendErrorKind::MissingPrerequisites);
    WF_ASSERT(r.error.missing_prerequisites.size() == 1);
    WF_ASSERT(r.error.missing_prerequisites[0] == "basic_knapping");
    WF_ASSERT(s.inventory() == before);

    r = s.unlock_tech("warp_drive", Selection{});
    WF_ASSERT(r.error.kind == SpendErrorKind::UnknownTarget);

    const auto hint = s.check_tech("basic_knapping");
    WF_ASSERT(hint.has_value() && hint->can_proceed);
    WF_ASSERT(!s.check_tech("warp_drive").has_value());

    r = s.unlock_tech("basic_knapping", pick2("stone", "granite", 10, "food", "berries", 5));
    WF_ASSERT(r.ok());
    WF_ASSERT(r.granted_id == "basic_knapping");
    WF_ASSERT(s.is_tech_unlocked("basic_knapping"));
    WF_ASSERT(s.inventory().count("stone", "granite") == 10);
    WF_ASSERT(s.inventory().count("food", "berries") == 5);

    r = s.unlock_tech("basic_knapping", pick2("stone", "granite", 10, "food", "berries", 5));
    WF_ASSERT(r.error.kind == SpendErrorKind::AlreadyUnlocked);
    WF_ASSERT(s.inventory().count("stone", "granite") == 10);
    WF_ASSERT(s.check_tech("basic_knapping")->already_unlocked);

    const auto next = s.available_techs();
    WF_ASSERT(next.size() == 3);
    WF_ASSERT(next[0] == "grinding" && next[1] == "fire_making" && next[2] == "cordage_making");

    // Only 10 granite left; grinding wants 15.
    const auto grind = s.check_tech("grinding");
    WF_ASSERT(grind && !grind->can_proceed);
    WF_ASSERT(grind->missing_resources.size() == 1);
    WF_ASSERT(grind->missing_resources[0].have == 10 && grind->missing_resources[0].needed == 15);
  }

  {
    // Full crafting chain up to a stone knife.
    Session s(db);
    s.add_resource("stone", "granite", 50);
    s.add_resource("stone", "flint", 30);
    s.add_resource("wood", "ash", 60);
    s.add_resource("food", "nuts", 5);

    WF_ASSERT(s.unlock_tech("basic_knapping", pick2("stone", "granite", 10, "food", "nuts", 5)).ok());
    WF_ASSERT(s.available_recipes().size() == 2);

    auto c = s.craft("hammerstone", CraftSelection{pick("stone", "granite", 10), {}});
    WF_ASSERT(c.ok());
    WF_ASSERT(c.item.instance_id == "hammerstone#1");
    WF_ASSERT(c.item.craftable_id == "hammerstone");
    WF_ASSERT(c.item.quality > 0.6 && c.item.quality < 0.7);
    WF_ASSERT(c.item.tier == QualityTier::Excellent);
    WF_ASSERT(c.item.kind == CraftableKind::Tool);
    WF_ASSERT(c.item.materials.size() == 1);
    WF_ASSERT(c.item.materials[0].material_id == "granite");
    WF_ASSERT(c.item.materials[0].quantity == 10);
    WF_ASSERT(s.state().owned_tools[0].materials.size() == 1);
    WF_ASSERT(s.owned_count("hammerstone") == 1);
    WF_ASSERT(s.owned_tool_ids().size() == 1);

    // Tech gates recipes.
    c = s.craft("crude_handle", CraftSelection{pick("wood", "ash", 5), {}});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::MissingPrerequisites);
    WF_ASSERT(c.spend.error.missing_prerequisites[0] == "hafting");
    WF_ASSERT(s.inventory().count("wood", "ash") == 60);

    WF_ASSERT(s.unlock_tech("cordage_making", pick("wood", "ash", 10)).ok());
    WF_ASSERT(s.unlock_tech("hafting", pick2("stone", "granite", 25, "wood", "ash", 15)).ok());

    // Owned tools and components gate the craftable graph.
    WF_ASSERT(s.is_craftable_available("crude_handle").value_or(false));
    WF_ASSERT(!s.is_craftable_available("stone_knife").value_or(true));
    WF_ASSERT(s.is_craftable_available("hammerstone").value_or(false));
    WF_ASSERT(!s.is_craftable_available("laser_sword").has_value());

    c = s.craft("crude_handle", CraftSelection{pick("wood", "ash", 5), {}});
    WF_ASSERT(c.ok());
    WF_ASSERT(c.item.kind == CraftableKind::Component);
    WF_ASSERT(c.item.materials.size() == 1 && c.item.materials[0].resource_type == "wood");
    WF_ASSERT(s.craft("fiber_binding", CraftSelection{pick("wood", "ash", 5), {}}).ok());
    WF_ASSERT(s.state().owned_components[0].kind == CraftableKind::Component);
    WF_ASSERT(s.is_craftable_available("stone_knife").value_or(false));
    WF_ASSERT(s.owned_ids().count("fiber_binding") == 1);
    {
      const auto avail = s.available_craftables();
      WF_ASSERT(std::find(avail.begin(), avail.end(), "stone_knife") != avail.end());
      // hafted_axe still needs a shaped_handle.
      WF_ASSERT(std::find(avail.begin(), avail.end(), "hafted_axe") == avail.end());
    }
    WF_ASSERT(s.state().owned_components.size() == 2);

    const auto hint = s.check_craft("stone_knife");
    WF_ASSERT(hint && hint->can_proceed);
    // The advisory check counts toolstone only for a toolstone slot.
    const auto axe_hint = s.check_craft("hafted_axe");
    WF_ASSERT(axe_hint && !axe_hint->can_proceed);
    WF_ASSERT(axe_hint->missing_components.size() == 1);
    WF_ASSERT(axe_hint->missing_components[0].id == "shaped_handle");

    const SessionState snapshot = s.state();
    const std::vector<std::string> both = {"crude_handle#2", "fiber_binding#3"};

    // Granite is not toolstone.
    c = s.craft("stone_knife", CraftSelection{pick("stone", "granite", 10), both});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::InvalidMaterial);

    // Components must match the recipe exactly.
    c = s.craft("stone_knife", CraftSelection{pick("stone", "flint", 10), {"crude_handle#2"}});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::WrongComponentSelection);
    c = s.craft("stone_knife", CraftSelection{pick("stone", "flint", 10), {"crude_handle#2", "crude_handle#2"}});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::WrongComponentSelection);
    c = s.craft("stone_knife", CraftSelection{pick("stone", "flint", 10), {"crude_handle#2", "fiber_binding#3",
                                                                           "hammerstone#1"}});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::WrongComponentSelection);

    // Exact quantity still applies to crafting.
    c = s.craft("stone_knife", CraftSelection{pick("stone", "flint", 11), both});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::WrongQuantitySelected);

    WF_ASSERT(s.state().inventory == snapshot.inventory);
    WF_ASSERT(s.state().owned_components.size() == 2);
    WF_ASSERT(s.state().next_instance_seq == snapshot.next_instance_seq);

    c = s.craft("stone_knife", CraftSelection{pick("stone", "flint", 10), both});
    WF_ASSERT(c.ok());
    WF_ASSERT(c.item.instance_id == "stone_knife#4");
    WF_ASSERT(c.spend.granted_id == "stone_knife");
    WF_ASSERT(s.state().owned_components.empty());
    WF_ASSERT(s.owned_count("stone_knife") == 1);
    // Tools are not consumed.
    WF_ASSERT(s.owned_count("hammerstone") == 1);
    WF_ASSERT(s.inventory().count("stone", "flint") == 20);

    c = s.craft("hand_axe", CraftSelection{pick("stone", "flint", 15), {}});
    WF_ASSERT(c.ok());
    WF_ASSERT(c.item.quality >= 0.0 && c.item.quality <= 1.0);

    c = s.craft("laser_sword", CraftSelection{});
    WF_ASSERT(c.spend.error.kind == SpendErrorKind::UnknownTarget);
  }

  {
    // Restored state is validated against the content.
    SessionState bad;
    bad.unlocked_techs.insert("time_travel");
    bool threw = false;
    try {
      Session s(db, bad);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    WF_ASSERT(threw);

    threw = false;
    try {
      Session s(nullptr);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    WF_ASSERT(threw);

    // Instance ids never collide with restored items.
    SessionState st;
    st.unlocked_techs.insert("basic_knapping");
    st.owned_tools.push_back(OwnedItem{"hammerstone#1", "hammerstone", 0.5, QualityTier::Good});
    st.inventory.add("stone", "basalt", 10);
    Session s(db, st);
    const auto c = s.craft("hammerstone", CraftSelection{pick("stone", "basalt", 10), {}});
    WF_ASSERT(c.ok());
    WF_ASSERT(c.item.instance_id == "hammerstone#2");
  }

  {
    // Successful transactions are logged at Info.
    const log::Level saved = log::level();
    std::vector<std::string> lines;
    log::set_sink([&](log::Level l, const std::string& msg) {
      if (l == log::Level::Info) lines.push_back(msg);
    });
    log::set_level(log::Level::Info);

    Session s(db);
    s.add_resource("stone", "chert", 10);
    s.add_resource("food", "roots", 5);
    WF_ASSERT(s.unlock_tech("basic_knapping", pick2("stone", "chert", 10, "food", "roots", 5)).ok());

    SessionConfig quiet;
    quiet.log_transactions = false;
    Session q(db, SessionState{}, quiet);
    q.add_resource("stone", "chert", 10);
    q.add_resource("food", "roots", 5);
    WF_ASSERT(q.unlock_tech("basic_knapping", pick2("stone", "chert", 10, "food", "roots", 5)).ok());

    log::set_sink(nullptr);
    log::set_level(saved);
    WF_ASSERT(lines.size() == 1);
    WF_ASSERT(lines[0].find("Basic Knapping") != std::string::npos);
  }

  return failed;
}

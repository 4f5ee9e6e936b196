#include "test.h"

#include <iostream>
#include <limits>

#include "walkforage/core/consumption.h"
#include "walkforage/core/content_loader.h"

using namespace walkforage;

#define WF_ASSERT(cond)                                                                                                \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                         \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

namespace {

std::vector<SpendRequirement> stone(int qty, bool toolstone = false) {
  return {SpendRequirement{"stone", qty, toolstone}};
}

} // namespace

int test_consumption() {
  int failed = 0;

  {
    // Tech cost of 10 stone + 5 food paid exactly.
    Inventory inv;
    inv.add("stone", "granite", 20);
    inv.add("food", "berries", 10);

    Selection sel;
    sel["stone"] = {{"granite", 10}};
    sel["food"] = {{"berries", 5}};

    const auto res = attempt_spend(spend_requirements(std::vector<ResourceCost>{{"stone", 10}, {"food", 5}}), sel, inv);
    WF_ASSERT(res.ok());
    WF_ASSERT(inv.count("stone", "granite") == 10);
    WF_ASSERT(inv.count("food", "berries") == 5);
    WF_ASSERT(res.consumed.size() == 2);
  }

  {
    // Mixed stacks: a drained stack disappears, the other shrinks.
    Inventory inv;
    inv.add("stone", "granite", 5);
    inv.add("stone", "basalt", 10);

    Selection sel;
    sel["stone"] = {{"granite", 5}, {"basalt", 5}};
    const auto res = attempt_spend(stone(10), sel, inv);
    WF_ASSERT(res.ok());
    WF_ASSERT(inv.stacks("stone").size() == 1);
    WF_ASSERT(inv.stacks("stone")[0].material_id == "basalt");
    WF_ASSERT(inv.count("stone", "basalt") == 5);
    for (const auto& s : inv.stacks("stone")) WF_ASSERT(s.quantity > 0);
  }

  {
    // Shortfall on one stack: typed error, inventory untouched.
    Inventory inv;
    inv.add("stone", "granite", 5);
    const Inventory before = inv;

    Selection sel;
    sel["stone"] = {{"granite", 10}};
    const auto res = attempt_spend(stone(10), sel, inv);
    WF_ASSERT(!res.ok());
    WF_ASSERT(res.error.kind == SpendErrorKind::InsufficientMaterial);
    WF_ASSERT(res.error.material_id == "granite");
    WF_ASSERT(res.error.have == 5);
    WF_ASSERT(res.error.needed == 10);
    WF_ASSERT(inv == before);
    WF_ASSERT(res.consumed.empty());
  }

  {
    // Exact match only: over- and under-selection fail even with plenty in stock.
    Inventory inv;
    inv.add("stone", "granite", 100);
    const Inventory before = inv;

    Selection over;
    over["stone"] = {{"granite", 11}};
    auto res = attempt_spend(stone(10), over, inv);
    WF_ASSERT(res.error.kind == SpendErrorKind::WrongQuantitySelected);
    WF_ASSERT(res.error.have == 11);
    WF_ASSERT(res.error.needed == 10);

    Selection under;
    under["stone"] = {{"granite", 9}};
    res = attempt_spend(stone(10), under, inv);
    WF_ASSERT(res.error.kind == SpendErrorKind::WrongQuantitySelected);

    // A negative entry cannot balance an over-selection.
    Selection tricky;
    tricky["stone"] = {{"granite", 12}, {"granite", -2}};
    res = attempt_spend(stone(10), tricky, inv);
    WF_ASSERT(res.error.kind == SpendErrorKind::WrongQuantitySelected);

    WF_ASSERT(inv == before);
  }

  {
    // Huge entries must not wrap around to the required total.
    Inventory inv;
    inv.add("stone", "granite", 20);
    const Inventory before = inv;

    const int big = std::numeric_limits<int>::max();
    Selection sel;
    sel["stone"] = {{"granite", big}, {"granite", big}, {"granite", 12}};
    const auto res = attempt_spend(stone(10), sel, inv);
    WF_ASSERT(!res.ok());
    WF_ASSERT(res.error.kind == SpendErrorKind::WrongQuantitySelected);
    WF_ASSERT(res.error.have == big);
    WF_ASSERT(res.consumed.empty());
    WF_ASSERT(inv == before);
  }

  {
    // Missing type selection.
    Inventory inv;
    inv.add("stone", "granite", 10);
    inv.add("wood", "oak", 10);
    const Inventory before = inv;

    Selection sel;
    sel["stone"] = {{"granite", 10}};
    const auto res = attempt_spend(
        std::vector<SpendRequirement>{{"stone", 10, false}, {"wood", 5, false}}, sel, inv);
    WF_ASSERT(res.error.kind == SpendErrorKind::NoSelection);
    WF_ASSERT(res.error.resource_type == "wood");
    WF_ASSERT(inv == before);

    // An empty entry list counts as no selection too.
    Selection empty_list;
    empty_list["stone"] = {};
    WF_ASSERT(attempt_spend(stone(10), empty_list, inv).error.kind == SpendErrorKind::NoSelection);
  }

  {
    // A later shortfall aborts without debiting the earlier entries.
    Inventory inv;
    inv.add("stone", "granite", 10);
    inv.add("wood", "oak", 2);
    const Inventory before = inv;

    Selection sel;
    sel["stone"] = {{"granite", 10}};
    sel["wood"] = {{"oak", 5}};
    const auto res =
        attempt_spend(std::vector<SpendRequirement>{{"stone", 10, false}, {"wood", 5, false}}, sel, inv);
    WF_ASSERT(res.error.kind == SpendErrorKind::InsufficientMaterial);
    WF_ASSERT(res.error.material_id == "oak");
    WF_ASSERT(inv == before);
  }

  {
    // Duplicate entries for one material are checked against the stack together.
    Inventory inv;
    inv.add("stone", "flint", 6);
    const Inventory before = inv;

    Selection sel;
    sel["stone"] = {{"flint", 4}, {"flint", 4}};
    const auto res = attempt_spend(stone(8), sel, inv);
    WF_ASSERT(res.error.kind == SpendErrorKind::InsufficientMaterial);
    WF_ASSERT(res.error.have == 6);
    WF_ASSERT(res.error.needed == 8);
    WF_ASSERT(inv == before);
  }

  {
    // Unrequested types in the selection are left alone.
    Inventory inv;
    inv.add("stone", "granite", 10);
    inv.add("wood", "oak", 3);

    Selection sel;
    sel["stone"] = {{"granite", 10}};
    sel["wood"] = {{"oak", 3}};
    const auto res = attempt_spend(stone(10), sel, inv);
    WF_ASSERT(res.ok());
    WF_ASSERT(inv.count("wood", "oak") == 3);
    WF_ASSERT(inv.stacks("stone").empty());
  }

  {
    // With content: unknown materials and non-toolstone picks are rejected.
    const auto db = load_content_db_from_file(walkforage_test::kLithicContent);
    Inventory inv;
    inv.add("stone", "granite", 10);
    inv.add("stone", "flint", 10);
    inv.add("stone", "moonrock", 10);
    const Inventory before = inv;

    Selection granite;
    granite["stone"] = {{"granite", 10}};
    auto res = attempt_spend(stone(10, true), granite, inv, db.get());
    WF_ASSERT(res.error.kind == SpendErrorKind::InvalidMaterial);
    WF_ASSERT(res.error.material_id == "granite");

    Selection moon;
    moon["stone"] = {{"moonrock", 10}};
    res = attempt_spend(stone(10), moon, inv, db.get());
    WF_ASSERT(res.error.kind == SpendErrorKind::InvalidMaterial);
    WF_ASSERT(inv == before);

    Selection flint;
    flint["stone"] = {{"flint", 10}};
    res = attempt_spend(stone(10, true), flint, inv, db.get());
    WF_ASSERT(res.ok());
    WF_ASSERT(inv.count("stone", "flint") == 0);

    WF_ASSERT(toolstone_total(inv, *db, "stone") == 0);
    inv.add("stone", "obsidian", 4);
    WF_ASSERT(toolstone_total(inv, *db, "stone") == 4);
    WF_ASSERT(inv.total("stone") == 24);
  }

  {
    WF_ASSERT(std::string(spend_error_kind_label(SpendErrorKind::InsufficientMaterial)) == "insufficient_material");
    WF_ASSERT(std::string(spend_error_kind_label(SpendErrorKind::None)) == "none");
  }

  return failed;
}

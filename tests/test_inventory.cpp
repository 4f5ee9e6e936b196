#include "test.h"

#include <iostream>

#include "walkforage/core/inventory.h"

using namespace walkforage;

#define WF_ASSERT(cond)                                                                                                \
  do {                                                                                                                 \
    if (!(cond)) {                                                                                                     \
      std::cerr << "FAIL: " << __FILE__ << ":" << __LINE__ << " expected " << #cond << "\n";                         \
      ++failed;                                                                                                        \
    }                                                                                                                  \
  } while (0)

int test_inventory() {
  int failed = 0;

  {
    Inventory inv;
    WF_ASSERT(inv.empty());
    inv.add("stone", "granite", 5);
    inv.add("stone", "basalt", 10);
    inv.add("stone", "granite", 3);
    WF_ASSERT(inv.count("stone", "granite") == 8);
    WF_ASSERT(inv.total("stone") == 18);
    WF_ASSERT(inv.stacks("stone").size() == 2);
    // Insertion order survives merging into an existing stack.
    WF_ASSERT(inv.stacks("stone")[0].material_id == "granite");
    WF_ASSERT(inv.has("stone", "basalt", 10));
    WF_ASSERT(!inv.has("stone", "basalt", 11));
  }

  {
    // Non-positive adds are ignored and never create an empty type entry.
    Inventory inv;
    inv.add("wood", "oak", 0);
    inv.add("wood", "oak", -4);
    WF_ASSERT(inv.empty());
    WF_ASSERT(inv.stacks("wood").empty());
    WF_ASSERT(inv.resource_types().empty());
  }

  {
    Inventory inv;
    inv.add("stone", "granite", 5);
    const Inventory before = inv;
    WF_ASSERT(!inv.remove("stone", "granite", 6));
    WF_ASSERT(!inv.remove("stone", "flint", 1));
    WF_ASSERT(!inv.remove("wood", "oak", 1));
    WF_ASSERT(!inv.remove("stone", "granite", -1));
    WF_ASSERT(inv == before);

    WF_ASSERT(inv.remove("stone", "granite", 2));
    WF_ASSERT(inv.count("stone", "granite") == 3);

    // Reaching zero removes the stack and the now-empty type.
    WF_ASSERT(inv.remove("stone", "granite", 3));
    WF_ASSERT(inv.count("stone", "granite") == 0);
    WF_ASSERT(inv.stacks("stone").empty());
    WF_ASSERT(inv.empty());
    WF_ASSERT(inv.raw().find("stone") == inv.raw().end());
  }

  {
    Inventory a;
    a.add("stone", "flint", 2);
    a.add("food", "berries", 4);
    Inventory b;
    b.add("stone", "flint", 3);
    b.add("wood", "pine", 7);
    a.merge(b);
    WF_ASSERT(a.count("stone", "flint") == 5);
    WF_ASSERT(a.count("wood", "pine") == 7);
    WF_ASSERT(a.count("food", "berries") == 4);

    const auto types = a.resource_types();
    WF_ASSERT(types.size() == 3);
    WF_ASSERT(types[0] == "food");
    WF_ASSERT(types[1] == "stone");
    WF_ASSERT(types[2] == "wood");
  }

  {
    // The builder keeps stacks exactly as given, duplicates included.
    const Inventory inv = InventoryBuilder().put("stone", "flint", 2).put("stone", "flint", 0).build();
    WF_ASSERT(inv.stacks("stone").size() == 2);
    WF_ASSERT(inv.stacks("stone")[1].quantity == 0);
  }

  return failed;
}

#pragma once

#include <string>
#include <vector>

#include "walkforage/core/content_db.h"
#include "walkforage/core/content_issue.h"

namespace walkforage {

// Validate raw content tables for internal consistency.
//
// Errors block startup (build_content_db throws on them):
//  - prerequisite / requirement cycles and graphs without a root,
//  - ids that do not resolve (prereqs, unlocks, recipes, tools, components,
//    resource types),
//  - duplicate or empty ids,
//  - QualityWeights that name unknown axes, are negative, or do not sum to 1.0,
//  - material property values outside their schema range, rarity outside [0,1].
//
// Warnings are lints (a tech that enables nothing, a craftable no tech enables).
//
// Output is sorted (errors first, then by subject and code) so it is stable
// for tests and CI.
std::vector<ContentIssue> validate_content_detailed(const ContentTables& tables);

// Messages of error-severity issues only, sorted.
std::vector<std::string> validate_content(const ContentTables& tables);

} // namespace walkforage

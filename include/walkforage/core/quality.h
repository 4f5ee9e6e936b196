#pragma once

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

#include "walkforage/core/consumption.h"
#include "walkforage/core/craftable.h"
#include "walkforage/core/inventory.h"

namespace walkforage {

class ContentDB;

enum class QualityTier { Poor, Adequate, Good, Excellent, Masterwork };

struct QualityTuning {
  // Score of a craft with no scorable material slot.
  double empty_score{0.1};

  // Lower bounds (inclusive) of Adequate, Good, Excellent and Masterwork.
  std::array<double, 4> tier_cutoffs{{0.2, 0.4, 0.6, 0.8}};
};

// Weighted, normalized property sum of one material, in [0,1].
// Unknown materials score 0. Axes missing on the material count as the
// schema minimum.
double material_score(const ContentDB& content, const std::string& resource_type, const std::string& material_id,
                      const std::unordered_map<std::string, double>& weights);

// Weights used for a resource type: the craftable's own, else the type's
// defaults. nullptr when neither exists.
const std::unordered_map<std::string, double>* effective_weights(const ContentDB& content,
                                                                 const CraftableDef& craftable,
                                                                 const std::string& resource_type);

// Quality of a crafted item in [0,1].
//
// Each slot's score is the quantity-weighted mean of the scores of the
// materials used for it; the result is the mean over the filled slots. A slot
// whose type has no weights still counts as filled and scores 0. Used
// materials of a type the craftable has no slot for and unknown materials do
// not count. With no filled slot the result is tuning.empty_score.
double score_craftable(const ContentDB& content, const CraftableDef& craftable, const std::vector<UsedMaterial>& used,
                       const QualityTuning& tuning = {});

QualityTier quality_tier(double score, const QualityTuning& tuning = {});

const char* quality_tier_label(QualityTier t);

// Case-insensitive; returns false for an unknown label.
bool quality_tier_from_string(const std::string& s, QualityTier& out);

struct RankedMaterial {
  std::string material_id;
  int available{0};
  double score{0.0};
};

// Inventory stacks usable for `slot`, best first (ties keep inventory order).
// Unknown materials, and non-toolstone ones for a toolstone slot, are left out.
std::vector<RankedMaterial> rank_materials_for_slot(const ContentDB& content, const CraftableDef& craftable,
                                                    const MaterialSlot& slot, const Inventory& inventory);

} // namespace walkforage

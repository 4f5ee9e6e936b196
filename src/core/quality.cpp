#include "walkforage/core/quality.h"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "walkforage/core/content_db.h"
#include "walkforage/util/sorted_keys.h"
#include "walkforage/util/strings.h"

namespace walkforage {

namespace {

double clamp01(double x) { return std::min(1.0, std::max(0.0, x)); }

double normalize(const PropertyDef& p, double v) {
  const double span = p.max_value - p.min_value;
  if (span <= 0.0) return 0.0;
  return clamp01((v - p.min_value) / span);
}

} // namespace

double material_score(const ContentDB& content, const std::string& resource_type, const std::string& material_id,
                      const std::unordered_map<std::string, double>& weights) {
  const ResourceTypeDef* type = content.resource_types().find(resource_type);
  const MaterialDef* m = content.find_material(resource_type, material_id);
  if (!type || !m) return 0.0;

  // Sorted axes keep the floating-point sum order fixed.
  double sum = 0.0;
  for (const auto& axis : util::sorted_keys(weights)) {
    const PropertyDef* p = type->find_property(axis);
    if (!p) continue;
    const auto it = m->properties.find(axis);
    const double v = it == m->properties.end() ? p->min_value : it->second;
    sum += normalize(*p, v) * weights.at(axis);
  }
  return clamp01(sum);
}

const std::unordered_map<std::string, double>* effective_weights(const ContentDB& content,
                                                                 const CraftableDef& craftable,
                                                                 const std::string& resource_type) {
  const auto it = craftable.quality_weights.find(resource_type);
  if (it != craftable.quality_weights.end() && !it->second.empty()) return &it->second;
  const ResourceTypeDef* type = content.resource_types().find(resource_type);
  if (type && !type->default_quality_weights.empty()) return &type->default_quality_weights;
  return nullptr;
}

double score_craftable(const ContentDB& content, const CraftableDef& craftable, const std::vector<UsedMaterial>& used,
                       const QualityTuning& tuning) {
  static const std::unordered_map<std::string, double> kNoWeights;
  double total = 0.0;
  int filled = 0;

  for (const auto& slot : craftable.materials) {
    // A type without weights still fills its slot, scoring 0.
    const auto* weights = effective_weights(content, craftable, slot.resource_type);
    if (!weights) weights = &kNoWeights;

    double weighted = 0.0;
    int qty = 0;
    for (const auto& u : used) {
      if (u.resource_type != slot.resource_type || u.quantity <= 0) continue;
      if (!content.find_material(u.resource_type, u.material_id)) continue;
      weighted += material_score(content, u.resource_type, u.material_id, *weights) * u.quantity;
      qty += u.quantity;
    }
    if (qty == 0) continue;

    total += weighted / qty;
    ++filled;
  }

  if (filled == 0) return tuning.empty_score;
  return clamp01(total / filled);
}

QualityTier quality_tier(double score, const QualityTuning& tuning) {
  const auto& c = tuning.tier_cutoffs;
  if (score >= c[3]) return QualityTier::Masterwork;
  if (score >= c[2]) return QualityTier::Excellent;
  if (score >= c[1]) return QualityTier::Good;
  if (score >= c[0]) return QualityTier::Adequate;
  return QualityTier::Poor;
}

const char* quality_tier_label(QualityTier t) {
  switch (t) {
    case QualityTier::Poor: return "poor";
    case QualityTier::Adequate: return "adequate";
    case QualityTier::Good: return "good";
    case QualityTier::Excellent: return "excellent";
    case QualityTier::Masterwork: return "masterwork";
  }
  return "poor";
}

bool quality_tier_from_string(const std::string& s, QualityTier& out) {
  const std::string k = to_lower(trim(s));
  for (QualityTier t : {QualityTier::Poor, QualityTier::Adequate, QualityTier::Good, QualityTier::Excellent,
                        QualityTier::Masterwork}) {
    if (k == quality_tier_label(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

std::vector<RankedMaterial> rank_materials_for_slot(const ContentDB& content, const CraftableDef& craftable,
                                                    const MaterialSlot& slot, const Inventory& inventory) {
  std::vector<RankedMaterial> out;
  const auto* weights = effective_weights(content, craftable, slot.resource_type);

  for (const auto& s : inventory.stacks(slot.resource_type)) {
    const MaterialDef* m = content.find_material(slot.resource_type, s.material_id);
    if (!m) continue;
    if (slot.requires_toolstone && !m->toolstone) continue;
    RankedMaterial r;
    r.material_id = s.material_id;
    r.available = s.quantity;
    r.score = weights ? material_score(content, slot.resource_type, s.material_id, *weights) : 0.0;
    out.push_back(std::move(r));
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const RankedMaterial& a, const RankedMaterial& b) { return a.score > b.score; });
  return out;
}

} // namespace walkforage

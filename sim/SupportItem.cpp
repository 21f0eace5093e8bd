#include "sim/SupportItem.hpp"

#include "core/Config.hpp"
#include "core/Rng.hpp"
#include <algorithm>

SupportItemWeights GetSupportItemWeights(const SpawnConfig &config) {
  return SupportItemWeights{config.iceTeaWeight, config.coldTowelWeight,
                            config.medicineWeight};
}

SupportItemWeights NormalizeWeights(const SupportItemWeights &weights) {
  SupportItemWeights w{std::max(weights.iceTea, 0.0f),
                       std::max(weights.coldTowel, 0.0f),
                       std::max(weights.medicine, 0.0f)};
  const float total = w.iceTea + w.coldTowel + w.medicine;
  if (total <= 0.0f) {
    return SupportItemWeights{1.0f, 0.0f, 0.0f};
  }
  w.iceTea /= total;
  w.coldTowel /= total;
  w.medicine /= total;
  return w;
}

SupportItemKind PickSupportItem(const SupportItemWeights &weights,
                                uint32_t &rngState) {
  const SupportItemWeights w = NormalizeWeights(weights);
  const float roll = core::NextFloat01(rngState);

  float cumulative = w.iceTea;
  if (w.iceTea > 0.0f && roll <= cumulative) {
    return SupportItemKind::IceTea;
  }
  cumulative += w.coldTowel;
  if (w.coldTowel > 0.0f && roll <= cumulative) {
    return SupportItemKind::ColdTowel;
  }
  if (w.medicine > 0.0f) {
    return SupportItemKind::Medicine;
  }
  // Float rounding left the roll just above the last non-zero bucket.
  return w.coldTowel > 0.0f ? SupportItemKind::ColdTowel
                            : SupportItemKind::IceTea;
}

const char *GetSupportItemLabel(SupportItemKind kind) {
  switch (kind) {
  case SupportItemKind::IceTea:
    return "ICE TEA";
  case SupportItemKind::ColdTowel:
    return "COLD TOWEL";
  case SupportItemKind::Medicine:
    return "MEDICINE";
  default:
    return "";
  }
}

const char *GetSupportItemVariant(SupportItemKind kind) {
  switch (kind) {
  case SupportItemKind::IceTea:
    return "support_ice_tea";
  case SupportItemKind::ColdTowel:
    return "support_cold_towel";
  case SupportItemKind::Medicine:
    return "support_medicine";
  default:
    return "";
  }
}

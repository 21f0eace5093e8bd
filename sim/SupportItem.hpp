#pragma once

#include <cstdint>

struct SpawnConfig;

// Support item kinds placed in authored support-item slots.
enum class SupportItemKind : int {
  None = -1,
  IceTea = 0,
  ColdTowel = 1,
  Medicine = 2
};

constexpr int kSupportItemKindCount = 3;

// Relative weights; normalized before every pick.
struct SupportItemWeights {
  float iceTea = 0.0f;
  float coldTowel = 0.0f;
  float medicine = 0.0f;
};

SupportItemWeights GetSupportItemWeights(const SpawnConfig &config);

// Scales the weights to sum to 1. Negative weights count as 0; all-zero
// weights become {1, 0, 0}.
SupportItemWeights NormalizeWeights(const SupportItemWeights &weights);

SupportItemKind PickSupportItem(const SupportItemWeights &weights,
                                uint32_t &rngState);

const char *GetSupportItemLabel(SupportItemKind kind);

// Pool key for a support item kind ("support_ice_tea", ...).
const char *GetSupportItemVariant(SupportItemKind kind);

// Pool key used for every coin.
constexpr const char *kCoinVariant = "coin";

#pragma once

#include <cstdint>

namespace cfg {
// --- Track layout ---
constexpr int kLaneCount = 3;
constexpr int kCenterLane = 1;
constexpr float kLaneDistance = 3.0f; // X spacing between lane centers

// --- Sliding window ---
constexpr int kActiveSegmentCount = 3;
constexpr float kSpawnDistanceAhead = 50.0f; // spawn when leading edge closer
constexpr float kRecycleMargin = 30.0f;      // recycle once agent this far past

// --- Pools ---
constexpr int kPoolSizePerVariant = 10;
constexpr int kCoinPoolMultiplier = 3; // coin pool = per-variant size * this
constexpr int kSupportItemPoolSize = 15;

// --- Difficulty ---
constexpr int kStartDifficulty = 1;
constexpr int kMaxDifficulty = 5;
constexpr int kSegmentsPerDifficultyIncrease = 5;

// --- Safe zones ---
constexpr float kGoalSafeZoneDistance = 100.0f;
constexpr bool kForceFirstSegmentSafe = true;
constexpr bool kClearCoinsInSafeZone = true;
constexpr bool kClearSupportItemsInSafeZone = true;

// --- Support items (normalized at pick time) ---
constexpr float kIceTeaWeight = 0.4f;
constexpr float kColdTowelWeight = 0.4f;
constexpr float kMedicineWeight = 0.2f;

// --- Placement heights ---
constexpr float kCoinHeight = 0.0f;
constexpr float kSupportItemHeight = 1.5f;

constexpr uint32_t kDefaultSeed = 0xC0FFEEu;
} // namespace cfg

// Runtime spawner tuning. Defaults mirror the cfg constants; a JSON document
// may override any subset of fields.
struct SpawnConfig {
  float laneDistance = cfg::kLaneDistance;
  int activeSegmentCount = cfg::kActiveSegmentCount;
  float spawnDistanceAhead = cfg::kSpawnDistanceAhead;
  float recycleMargin = cfg::kRecycleMargin;

  int poolSizePerVariant = cfg::kPoolSizePerVariant;
  int coinPoolMultiplier = cfg::kCoinPoolMultiplier;
  int supportItemPoolSize = cfg::kSupportItemPoolSize;
  bool allowGenericFallback = true; // generic variant when the set has none

  int startDifficulty = cfg::kStartDifficulty;
  int maxDifficulty = cfg::kMaxDifficulty;
  int segmentsPerDifficultyIncrease = cfg::kSegmentsPerDifficultyIncrease;

  float goalSafeZoneDistance = cfg::kGoalSafeZoneDistance;
  bool forceFirstSegmentSafe = cfg::kForceFirstSegmentSafe;
  bool clearCoinsInSafeZone = cfg::kClearCoinsInSafeZone;
  bool clearSupportItemsInSafeZone = cfg::kClearSupportItemsInSafeZone;

  float iceTeaWeight = cfg::kIceTeaWeight;
  float coldTowelWeight = cfg::kColdTowelWeight;
  float medicineWeight = cfg::kMedicineWeight;

  float coinHeight = cfg::kCoinHeight;
  float supportItemHeight = cfg::kSupportItemHeight;

  uint32_t seed = cfg::kDefaultSeed;
};

// Parse overrides from JSON text into `config`. On a parse error the
// config is left untouched and false is returned.
bool ParseSpawnConfig(SpawnConfig &config, const char *jsonText);

// Load overrides from assets/<relativePath>. A missing file keeps the
// defaults and returns false with a warning.
bool LoadSpawnConfigFromFile(SpawnConfig &config, const char *relativePath);

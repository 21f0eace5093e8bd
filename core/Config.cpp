#include "core/Config.hpp"

#include "core/Assets.hpp"
#include "core/Log.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

void ApplyOverrides(SpawnConfig &c, const json &j) {
  c.laneDistance = j.value("laneDistance", c.laneDistance);
  c.activeSegmentCount = j.value("activeSegmentCount", c.activeSegmentCount);
  c.spawnDistanceAhead = j.value("spawnDistanceAhead", c.spawnDistanceAhead);
  c.recycleMargin = j.value("recycleMargin", c.recycleMargin);

  c.poolSizePerVariant = j.value("poolSizePerVariant", c.poolSizePerVariant);
  c.coinPoolMultiplier = j.value("coinPoolMultiplier", c.coinPoolMultiplier);
  c.supportItemPoolSize = j.value("supportItemPoolSize", c.supportItemPoolSize);
  c.allowGenericFallback =
      j.value("allowGenericFallback", c.allowGenericFallback);

  c.startDifficulty = j.value("startDifficulty", c.startDifficulty);
  c.maxDifficulty = j.value("maxDifficulty", c.maxDifficulty);
  c.segmentsPerDifficultyIncrease =
      j.value("segmentsPerDifficultyIncrease", c.segmentsPerDifficultyIncrease);

  c.goalSafeZoneDistance =
      j.value("goalSafeZoneDistance", c.goalSafeZoneDistance);
  c.forceFirstSegmentSafe =
      j.value("forceFirstSegmentSafe", c.forceFirstSegmentSafe);
  c.clearCoinsInSafeZone =
      j.value("clearCoinsInSafeZone", c.clearCoinsInSafeZone);
  c.clearSupportItemsInSafeZone =
      j.value("clearSupportItemsInSafeZone", c.clearSupportItemsInSafeZone);

  if (j.contains("supportItemWeights")) {
    const auto &w = j["supportItemWeights"];
    c.iceTeaWeight = w.value("iceTea", c.iceTeaWeight);
    c.coldTowelWeight = w.value("coldTowel", c.coldTowelWeight);
    c.medicineWeight = w.value("medicine", c.medicineWeight);
  }

  c.coinHeight = j.value("coinHeight", c.coinHeight);
  c.supportItemHeight = j.value("supportItemHeight", c.supportItemHeight);
  c.seed = j.value("seed", c.seed);
}

} // namespace

bool ParseSpawnConfig(SpawnConfig &config, const char *jsonText) {
  try {
    const json data = json::parse(jsonText);
    if (!data.is_object()) {
      LOG_ERROR("Spawner config must be a JSON object");
      return false;
    }

    SpawnConfig parsed = config;
    ApplyOverrides(parsed, data);

    if (parsed.activeSegmentCount < 1) {
      LOG_WARN("activeSegmentCount {} clamped to 1", parsed.activeSegmentCount);
      parsed.activeSegmentCount = 1;
    }
    if (parsed.segmentsPerDifficultyIncrease < 1) {
      LOG_WARN("segmentsPerDifficultyIncrease {} clamped to 1",
               parsed.segmentsPerDifficultyIncrease);
      parsed.segmentsPerDifficultyIncrease = 1;
    }
    if (parsed.maxDifficulty < parsed.startDifficulty) {
      LOG_WARN("maxDifficulty {} below startDifficulty {}, raised",
               parsed.maxDifficulty, parsed.startDifficulty);
      parsed.maxDifficulty = parsed.startDifficulty;
    }

    config = parsed;
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("Spawner config error: {}", e.what());
    return false;
  }
}

bool LoadSpawnConfigFromFile(SpawnConfig &config, const char *relativePath) {
  const std::string fullPath = assets::Path(relativePath);
  std::ifstream f(fullPath);
  if (!f.is_open()) {
    LOG_WARN("Spawner config not found: {} (using defaults)", fullPath);
    return false;
  }

  std::stringstream buffer;
  buffer << f.rdbuf();
  const std::string text = buffer.str();
  if (!ParseSpawnConfig(config, text.c_str())) {
    LOG_ERROR("Failed to apply spawner config: {}", fullPath);
    return false;
  }

  LOG_INFO("Spawner config loaded from {}", fullPath);
  return true;
}

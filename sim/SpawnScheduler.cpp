#include "sim/SpawnScheduler.hpp"

#include "core/Log.hpp"
#include "sim/LaneRules.hpp"
#include "sim/SupportItem.hpp"
#include <algorithm>
#include <cmath>

namespace {

bool IsValidLane(int lane) { return lane >= 0 && lane < cfg::kLaneCount; }

bool MatchesMask(SpawnKind kind, unsigned mask) {
  switch (kind) {
  case SpawnKind::Obstacle:
    return (mask & kMaskObstacles) != 0;
  case SpawnKind::Coin:
    return (mask & kMaskCoins) != 0;
  case SpawnKind::SupportItem:
    return (mask & kMaskSupportItems) != 0;
  default:
    return false;
  }
}

} // namespace

SpawnScheduler::SpawnScheduler(ContentCatalog &catalog,
                               const VariantClassificationTable &classification,
                               InstancePoolRegistry &pools,
                               const SafeZonePolicy &policy,
                               const SpawnConfig &config)
    : catalog(catalog), classification(classification), pools(pools),
      policy(policy), config(config) {
  rngState = (config.seed == 0u) ? 1u : config.seed;
  currentDifficulty = policy.CurrentDifficulty(0);
}

bool SpawnScheduler::Initialize() {
  if (!catalog.IsLoaded()) {
    LOG_ERROR("[Spawner] Catalog not loaded, spawner will not start");
    return false;
  }
  if (!catalog.Validate()) {
    LOG_WARN("[Spawner] Catalog '{}' has invalid entries, continuing",
             catalog.GetSourceName());
  }

  // A new run starts from an empty window.
  if (!activeSegments.empty()) {
    LOG_INFO("[Spawner] Restarting, releasing {} sections of the previous run",
             activeSegments.size());
    for (auto &segment : activeSegments) {
      ReleaseSegment(segment);
    }
    activeSegments.clear();
  }
  stats = SpawnStats{};
  spawnStalled = false;

  BuildPools();

  nextSpawnZ = 0.0f;
  segmentsSpawned = 0;
  currentDifficulty = policy.CurrentDifficulty(0);
  lastSegmentSafe = false;
  initialized = true;
  active = true;

  for (int i = 0; i < config.activeSegmentCount; ++i) {
    if (!SpawnNextSegment()) {
      break;
    }
  }

  LOG_INFO("[Spawner] Initialized with {} sections ({})", activeSegments.size(),
           pools.Describe());
  return true;
}

void SpawnScheduler::BuildPools() {
  BuildObstaclePools(variantSet);

  if (config.allowGenericFallback) {
    for (const char *key :
         {kGenericBarrierVariant, kGenericLowVariant, kGenericHighVariant}) {
      if (!pools.HasPool(key)) {
        pools.InitializePool(key, config.poolSizePerVariant);
      }
    }
  }

  if (!pools.HasPool(kCoinVariant)) {
    pools.InitializePool(kCoinVariant,
                         config.poolSizePerVariant * config.coinPoolMultiplier);
  }

  // Split the support item budget by weight so every pickable kind starts
  // with at least one instance.
  const SupportItemWeights w = NormalizeWeights(GetSupportItemWeights(config));
  const float weights[kSupportItemKindCount] = {w.iceTea, w.coldTowel,
                                                w.medicine};
  for (int i = 0; i < kSupportItemKindCount; ++i) {
    const char *key = GetSupportItemVariant(static_cast<SupportItemKind>(i));
    if (weights[i] <= 0.0f || pools.HasPool(key)) {
      continue;
    }
    const int size = std::max(
        1, static_cast<int>(std::ceil(weights[i] *
                                      static_cast<float>(
                                          config.supportItemPoolSize))));
    pools.InitializePool(key, size);
  }
}

void SpawnScheduler::BuildObstaclePools(const VariantSet &set) {
  if (set.IsEmpty()) {
    LOG_WARN("[Spawner] No obstacle variant set, generic variants only");
    return;
  }
  for (const auto &key : set.AllVariantKeys()) {
    if (!pools.HasPool(key)) {
      pools.InitializePool(key, config.poolSizePerVariant);
    }
  }
  LOG_DEBUG("[Spawner] Obstacle pools ready for set '{}'", set.name);
}

void SpawnScheduler::ClearObstaclePools(const VariantSet &set) {
  for (const auto &key : set.AllVariantKeys()) {
    pools.ClearPool(key);
  }
}

void SpawnScheduler::Update(float agentZ) {
  if (!warmup.IsDone()) {
    warmup.Step(pools);
  }

  if (!active) {
    return;
  }

  if (activeSegments.empty()) {
    // Nothing could be spawned so far (empty catalog); retry every tick.
    SpawnNextSegment();
  } else {
    const ActiveSegment &lead = activeSegments.back();
    if (lead.endZ - agentZ < config.spawnDistanceAhead) {
      SpawnNextSegment();
    }
  }

  TryRecycleOldest(agentZ);
}

bool SpawnScheduler::SpawnNextSegment() {
  SegmentPtr def = catalog.GetSegment(currentDifficulty, rngState);
  if (!def) {
    ++stats.failedSpawns;
    if (!spawnStalled) {
      LOG_WARN("[Spawner] No section data available, retrying every tick");
      spawnStalled = true;
    }
    return false;
  }
  if (spawnStalled) {
    LOG_INFO("[Spawner] Section data available again after {} failed ticks",
             stats.failedSpawns);
    spawnStalled = false;
  }

  ActiveSegment segment;
  segment.definition = def;
  segment.startZ = nextSpawnZ;
  segment.endZ = nextSpawnZ + std::max(def->length, 0.0f);
  segment.difficulty = currentDifficulty;
  segment.safeReason =
      policy.GetSafeReason(segment.startZ, segmentsSpawned, def->isSafeZone);
  segment.safe = segment.safeReason != SafeReason::None;

  if (segment.safe && !lastSegmentSafe) {
    LOG_INFO("[Spawner] Entering safe zone at z={:.1f} ({})", segment.startZ,
             GetSafeReasonLabel(segment.safeReason));
    if (events.onEnteredSafeZone) {
      events.onEnteredSafeZone(segment.startZ, segment.safeReason);
    }
  }
  lastSegmentSafe = segment.safe;

  // Obstacles, then coins, then support items.
  if (policy.ShouldSpawnObstacles(segment.safe)) {
    for (const auto &placement : def->obstacles) {
      SpawnObstacle(placement, segment);
    }
  }
  if (policy.ShouldSpawnCoins(segment.safe)) {
    for (const auto &group : def->coins) {
      SpawnCoinLine(group, segment);
    }
  }
  if (policy.ShouldSpawnSupportItems(segment.safe)) {
    for (const auto &placement : def->supportItems) {
      SpawnSupportItem(placement, segment);
    }
  }

  nextSpawnZ = segment.endZ;
  ++segmentsSpawned;
  ++stats.segmentsSpawned;

  LOG_DEBUG("[Spawner] Spawned '{}' at z={:.1f} ({} objects{})", def->id,
            segment.startZ, segment.objects.size(),
            segment.safe ? ", safe" : "");

  activeSegments.push_back(std::move(segment));
  if (events.onSegmentSpawned) {
    events.onSegmentSpawned(activeSegments.back());
  }

  const int nextDifficulty = policy.CurrentDifficulty(segmentsSpawned);
  if (nextDifficulty != currentDifficulty) {
    currentDifficulty = nextDifficulty;
    LOG_INFO("[Spawner] Difficulty increased to {}", currentDifficulty);
  }
  return true;
}

std::string SpawnScheduler::ResolveVariantKey(const std::string &category) {
  std::string key = variantSet.GetRandomVariant(category, rngState);
  if (!key.empty()) {
    return key;
  }
  if (!config.allowGenericFallback) {
    return {};
  }
  return GetGenericFallbackVariant(category);
}

bool SpawnScheduler::SpawnObstacle(const ObstaclePlacement &placement,
                                   ActiveSegment &segment) {
  if (!IsValidLane(placement.lane)) {
    LOG_WARN("[Spawner] '{}' obstacle in invalid lane {} skipped",
             segment.definition->id, placement.lane);
    ++stats.placementsSkipped;
    return false;
  }

  const std::string key = ResolveVariantKey(placement.category);
  if (key.empty()) {
    LOG_WARN("[Spawner] No variant for obstacle type '{}', skipped",
             placement.category);
    ++stats.placementsSkipped;
    return false;
  }

  const ObstacleType type = VariantClassificationTable::ResolveType(key);
  const VariantRecord record = classification.GetRecord(type);
  const int lane =
      LaneRestrictionValidator::Resolve(type, placement.lane, rngState);
  if (lane != placement.lane) {
    LOG_DEBUG("[Spawner] {} not allowed in lane {}, moved to lane {}",
              GetObstacleTypeLabel(type), placement.lane, lane);
  }

  PooledInstance *instance = pools.Acquire(key);
  instance->position = Vector3{LaneToX(lane, config.laneDistance),
                               placement.yOffset,
                               segment.startZ + placement.zOffset};
  instance->obstacleType = type;
  instance->scheduler = this;

  segment.objects.push_back(SpawnedObject{instance->id, SpawnKind::Obstacle});
  ++stats.obstaclesPlaced;
  LOG_TRACE("[Spawner] {} ({}) lane {} z={:.1f}", key,
            GetBehaviorClassLabel(record.behavior), lane, instance->position.z);
  return true;
}

void SpawnScheduler::SpawnCoinLine(const CoinGroupPlacement &group,
                                   ActiveSegment &segment) {
  if (!IsValidLane(group.lane)) {
    LOG_WARN("[Spawner] '{}' coin line in invalid lane {} skipped",
             segment.definition->id, group.lane);
    ++stats.placementsSkipped;
    return;
  }
  if (group.pattern != "vertical_line") {
    LOG_DEBUG("[Spawner] Coin pattern '{}' expanded as a line", group.pattern);
  }

  const float x = LaneToX(group.lane, config.laneDistance);
  for (int i = 0; i < group.count; ++i) {
    PooledInstance *coin = pools.Acquire(kCoinVariant);
    coin->position =
        Vector3{x, config.coinHeight,
                segment.startZ + group.zStart +
                    static_cast<float>(i) * group.spacing};
    coin->scheduler = this;
    segment.objects.push_back(SpawnedObject{coin->id, SpawnKind::Coin});
    ++stats.coinsPlaced;
  }
}

bool SpawnScheduler::SpawnSupportItem(const SupportItemPlacement &placement,
                                      ActiveSegment &segment) {
  if (!IsValidLane(placement.lane)) {
    LOG_WARN("[Spawner] '{}' support item in invalid lane {} skipped",
             segment.definition->id, placement.lane);
    ++stats.placementsSkipped;
    return false;
  }

  const SupportItemKind kind =
      PickSupportItem(GetSupportItemWeights(config), rngState);
  PooledInstance *item = pools.Acquire(GetSupportItemVariant(kind));
  item->position = Vector3{LaneToX(placement.lane, config.laneDistance),
                           config.supportItemHeight,
                           segment.startZ + placement.zOffset};
  item->scheduler = this;

  segment.objects.push_back(SpawnedObject{item->id, SpawnKind::SupportItem});
  ++stats.supportItemsPlaced;
  return true;
}

bool SpawnScheduler::TryRecycleOldest(float agentZ) {
  if (!active || recyclingSuspended || activeSegments.empty()) {
    return false;
  }

  ActiveSegment &oldest = activeSegments.front();
  if (agentZ <= oldest.endZ + config.recycleMargin) {
    return false;
  }

  // Listeners still see the section's objects.
  if (events.onSegmentRecycled) {
    events.onSegmentRecycled(oldest);
  }
  ReleaseSegment(oldest);
  LOG_DEBUG("[Spawner] Recycled '{}' ending at z={:.1f}",
            oldest.definition->id, oldest.endZ);
  activeSegments.pop_front();
  ++stats.segmentsRecycled;
  return true;
}

void SpawnScheduler::ReleaseSegment(ActiveSegment &segment) {
  for (const auto &object : segment.objects) {
    pools.Release(object.id);
  }
  segment.objects.clear();
}

void SpawnScheduler::Stop() {
  if (active) {
    LOG_INFO("[Spawner] Stopped at z={:.1f} after {} sections", nextSpawnZ,
             segmentsSpawned);
  }
  active = false;
}

void SpawnScheduler::AbandonAll() {
  int deactivated = 0;
  for (auto &segment : activeSegments) {
    for (const auto &object : segment.objects) {
      if (PooledInstance *instance = pools.Find(object.id)) {
        instance->active = false;
        ++deactivated;
      }
    }
  }
  activeSegments.clear();
  LOG_INFO("[Spawner] Abandoned {} live instances", deactivated);
}

void SpawnScheduler::SetRecyclingSuspended(bool suspended) {
  if (recyclingSuspended != suspended) {
    LOG_DEBUG("[Spawner] Recycling {}", suspended ? "paused" : "resumed");
  }
  recyclingSuspended = suspended;
}

bool SpawnScheduler::ReloadCatalog(const std::string &name) {
  if (!catalog.Load(name)) {
    LOG_ERROR("[Spawner] Reload of '{}' failed, keeping previous sections",
              name);
    return false;
  }
  if (!catalog.Validate()) {
    LOG_WARN("[Spawner] Reloaded catalog '{}' has invalid entries", name);
  }
  return true;
}

int SpawnScheduler::ClearContentNearGoal(unsigned kinds) {
  if (!policy.HasGoal()) {
    return 0;
  }

  const float bandStart = policy.GetBandStart();
  int cleared = 0;
  for (auto &segment : activeSegments) {
    if (segment.startZ < bandStart) {
      continue;
    }
    for (const auto &object : segment.objects) {
      if (!MatchesMask(object.kind, kinds)) {
        continue;
      }
      PooledInstance *instance = pools.Find(object.id);
      if (instance != nullptr && instance->active) {
        instance->active = false;
        ++cleared;
      }
    }
  }

  if (cleared > 0) {
    LOG_INFO("[Spawner] Cleared {} instances near the goal", cleared);
  }
  return cleared;
}

bool SpawnScheduler::ReleaseInstance(InstanceId id) {
  for (auto &segment : activeSegments) {
    auto &objects = segment.objects;
    const auto it =
        std::find_if(objects.begin(), objects.end(),
                     [id](const SpawnedObject &o) { return o.id == id; });
    if (it != objects.end()) {
      objects.erase(it);
      pools.Release(id);
      return true;
    }
  }
  LOG_DEBUG("[Spawner] Instance {} is not owned by any active section", id);
  return false;
}

bool SpawnScheduler::IsInstanceTracked(InstanceId id) const {
  for (const auto &segment : activeSegments) {
    for (const auto &object : segment.objects) {
      if (object.id == id) {
        return true;
      }
    }
  }
  return false;
}

void SpawnScheduler::SetVariantSet(const VariantSet &set) {
  if (initialized) {
    ClearObstaclePools(variantSet);
    BuildObstaclePools(set);
  }
  variantSet = set;
  LOG_INFO("[Spawner] Obstacle set '{}' active", set.name);
}

void SpawnScheduler::PreloadVariantSet(const VariantSet &set) {
  preloadedSet = set;
  warmup = PoolWarmup(set.AllVariantKeys(), config.poolSizePerVariant);
  LOG_INFO("[Spawner] Preloading obstacle set '{}' ({} variants)", set.name,
           warmup.GetRemaining());
}

bool SpawnScheduler::ActivatePreloadedVariantSet() {
  if (!preloadedSet.has_value()) {
    LOG_WARN("[Spawner] No preloaded obstacle set to activate");
    return false;
  }
  if (!warmup.IsDone()) {
    LOG_WARN("[Spawner] Warm-up of '{}' unfinished, building {} pools now",
             preloadedSet->name, warmup.GetRemaining());
    while (warmup.Step(pools)) {
    }
  }
  variantSet = std::move(*preloadedSet);
  preloadedSet.reset();
  LOG_INFO("[Spawner] Activated preloaded obstacle set '{}'", variantSet.name);
  return true;
}

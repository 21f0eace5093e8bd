#pragma once

#include "core/Config.hpp"
#include "sim/ContentCatalog.hpp"
#include "sim/InstancePool.hpp"
#include "sim/ObstacleType.hpp"
#include "sim/SafeZonePolicy.hpp"
#include "sim/SegmentData.hpp"
#include "sim/VariantSet.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class SpawnKind : int { Obstacle = 0, Coin = 1, SupportItem = 2 };

// Bit flags for the goal clean-up calls.
enum SpawnKindMask : unsigned {
  kMaskObstacles = 1u << 0,
  kMaskCoins = 1u << 1,
  kMaskSupportItems = 1u << 2,
  kMaskAll = kMaskObstacles | kMaskCoins | kMaskSupportItems
};

struct SpawnedObject {
  InstanceId id = kInvalidInstance;
  SpawnKind kind = SpawnKind::Obstacle;
};

// One slot of the sliding window. Owns (by id) every instance it placed
// until it is recycled.
struct ActiveSegment {
  SegmentPtr definition;
  float startZ = 0.0f;
  float endZ = 0.0f;
  int difficulty = 0;
  bool safe = false;
  SafeReason safeReason = SafeReason::None;
  std::vector<SpawnedObject> objects;
};

// Notifications for logging/UI collaborators. All optional.
struct SpawnEvents {
  std::function<void(const ActiveSegment &)> onSegmentSpawned;
  std::function<void(const ActiveSegment &)> onSegmentRecycled; // before release
  std::function<void(float startZ, SafeReason reason)> onEnteredSafeZone;
};

struct SpawnStats {
  int segmentsSpawned = 0;
  int segmentsRecycled = 0;
  int obstaclesPlaced = 0;
  int coinsPlaced = 0;
  int supportItemsPlaced = 0;
  int placementsSkipped = 0;
  int failedSpawns = 0; // ticks where the catalog produced nothing
};

// Streams catalog segments ahead of the agent and recycles them behind it.
// Driven once per tick through Update(); all services are owned by the
// caller and must outlive the scheduler.
class SpawnScheduler {
public:
  SpawnScheduler(ContentCatalog &catalog,
                 const VariantClassificationTable &classification,
                 InstancePoolRegistry &pools, const SafeZonePolicy &policy,
                 const SpawnConfig &config);

  // Builds pools and fills the initial window. Fails (and the scheduler
  // stays inactive) when the catalog has not been loaded. Calling it again
  // releases the previous run's window and resets the stats.
  bool Initialize();

  void Update(float agentZ);

  // Appends one segment at the cursor. False when the catalog is empty.
  bool SpawnNextSegment();

  // Recycles the trailing segment once the agent is past its end plus the
  // recycle margin. False when nothing was recycled.
  bool TryRecycleOldest(float agentZ);

  // Run end: stop spawning and recycling. Nothing is drained.
  void Stop();
  // Deactivates every live instance in bulk and drops the window.
  void AbandonAll();

  void SetRecyclingSuspended(bool suspended);
  bool IsRecyclingSuspended() const { return recyclingSuspended; }

  // Reload the content source by name; the old catalog stays on failure.
  bool ReloadCatalog(const std::string &name);

  // Hide content in segments that start inside the goal band. Returns the
  // number of instances deactivated; 0 in open-ended mode.
  int ClearContentNearGoal(unsigned kinds = kMaskAll);
  int ClearObstaclesNearGoal() { return ClearContentNearGoal(kMaskObstacles); }
  int ClearCoinsNearGoal() { return ClearContentNearGoal(kMaskCoins); }
  int ClearSupportItemsNearGoal() {
    return ClearContentNearGoal(kMaskSupportItems);
  }

  // Early return of one instance (collected coin, destroyed obstacle).
  bool ReleaseInstance(InstanceId id);
  bool IsInstanceTracked(InstanceId id) const;

  // Replace the obstacle set. After Initialize() this rebuilds the pools.
  void SetVariantSet(const VariantSet &set);
  // Warm pools for a set one variant per tick, then swap with
  // ActivatePreloadedVariantSet(), which finishes any remaining steps first.
  void PreloadVariantSet(const VariantSet &set);
  bool ActivatePreloadedVariantSet();
  bool IsWarmingUp() const { return !warmup.IsDone(); }

  void SetEvents(SpawnEvents newEvents) { events = std::move(newEvents); }

  std::string GetPoolStats() const { return pools.Describe(); }
  float GetSpawnCursor() const { return nextSpawnZ; }
  int GetSegmentsSpawned() const { return segmentsSpawned; }
  int GetCurrentDifficulty() const { return currentDifficulty; }
  bool IsActive() const { return active; }
  const std::deque<ActiveSegment> &GetActiveSegments() const {
    return activeSegments;
  }
  const SpawnStats &GetStats() const { return stats; }
  const VariantSet &GetVariantSet() const { return variantSet; }
  const SpawnConfig &GetConfig() const { return config; }

private:
  void BuildPools();
  void BuildObstaclePools(const VariantSet &set);
  void ClearObstaclePools(const VariantSet &set);

  std::string ResolveVariantKey(const std::string &category);
  bool SpawnObstacle(const ObstaclePlacement &placement, ActiveSegment &segment);
  void SpawnCoinLine(const CoinGroupPlacement &group, ActiveSegment &segment);
  bool SpawnSupportItem(const SupportItemPlacement &placement,
                        ActiveSegment &segment);
  void ReleaseSegment(ActiveSegment &segment);

  ContentCatalog &catalog;
  const VariantClassificationTable &classification;
  InstancePoolRegistry &pools;
  const SafeZonePolicy &policy;
  SpawnConfig config;

  VariantSet variantSet{};
  std::optional<VariantSet> preloadedSet;
  PoolWarmup warmup{};

  std::deque<ActiveSegment> activeSegments;
  SpawnEvents events{};
  SpawnStats stats{};

  uint32_t rngState = 1u;
  float nextSpawnZ = 0.0f;
  int segmentsSpawned = 0;
  int currentDifficulty = 0;
  bool initialized = false;
  bool active = false;
  bool recyclingSuspended = false;
  bool lastSegmentSafe = false;
  bool spawnStalled = false; // catalog produced nothing on the last attempt
};

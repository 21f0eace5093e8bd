#pragma once

#include "sim/ObstacleType.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <raylib.h>
#include <string>
#include <unordered_map>
#include <vector>

class SpawnScheduler;

using InstanceId = uint32_t;
constexpr InstanceId kInvalidInstance = 0;

// A reusable content instance. `variantKey` is stamped at construction and
// routes the instance back to its pool on release.
struct PooledInstance {
  InstanceId id = kInvalidInstance;
  std::string variantKey;
  bool active = false;    // visible / participating in gameplay
  bool available = false; // sitting in its pool's queue
  Vector3 position{0.0f, 0.0f, 0.0f};

  // Set on placed obstacles so collision handling can look up behavior
  // without re-resolving the variant name.
  ObstacleType obstacleType = ObstacleType::GenericBarrier;
  const SpawnScheduler *scheduler = nullptr;

  uint32_t poolGeneration = 0; // which incarnation of the pool counts it
};

struct PoolStats {
  int available = 0;
  int inUse = 0;
  int created = 0; // grows with on-demand construction
};

// One queue of idle instances per variant key. The registry owns every
// instance it ever constructed; callers hold ids and raw pointers.
class InstancePoolRegistry {
public:
  // Pre-creates `size` deactivated instances. Returns false (and warns)
  // when a pool for the key already exists.
  bool InitializePool(const std::string &variantKey, int size);

  // Never returns null. Dequeues an idle instance or constructs a new one
  // (logged as a sizing warning). The result is activated.
  PooledInstance *Acquire(const std::string &variantKey);

  // Deactivates and requeues under the instance's own variant key, creating
  // that pool if needed. Unknown ids and instances already idle are ignored.
  void Release(InstanceId id);

  // Destroys the idle instances of a pool and forgets the pool. Instances
  // still in use survive and are adopted by a new pool on release.
  void ClearPool(const std::string &variantKey);
  void ClearAll();

  bool HasPool(const std::string &variantKey) const;
  PooledInstance *Find(InstanceId id);
  const PooledInstance *Find(InstanceId id) const;

  PoolStats GetStats(const std::string &variantKey) const;
  int GetPoolCount() const { return static_cast<int>(pools.size()); }
  int GetTotalAvailable() const;
  int GetLiveInstanceCount() const { return static_cast<int>(instances.size()); }
  std::vector<std::string> GetPoolKeys() const;

  // "Pools: N, Objects: M" (M = idle instances)
  std::string Describe() const;

private:
  struct PoolEntry {
    std::deque<PooledInstance *> available;
    int created = 0;
    int inUse = 0;
    uint32_t generation = 0;
  };

  PoolEntry &CreateEntry(const std::string &variantKey);
  PooledInstance *Construct(const std::string &variantKey, PoolEntry &entry);

  std::unordered_map<std::string, PoolEntry> pools;
  std::unordered_map<InstanceId, std::unique_ptr<PooledInstance>> instances;
  InstanceId nextId = 1;
  uint32_t nextGeneration = 1;
};

// Builds a list of pools one variant per Step() so the construction cost can
// be spread across ticks. Keys that already have a pool are skipped without
// consuming a step.
class PoolWarmup {
public:
  PoolWarmup() = default;
  PoolWarmup(std::vector<std::string> variantKeys, int sizePerVariant);

  // Builds at most one pool. Returns true while work remains.
  bool Step(InstancePoolRegistry &registry);

  bool IsDone() const { return next >= keys.size(); }
  int GetRemaining() const { return static_cast<int>(keys.size() - next); }

private:
  std::vector<std::string> keys;
  size_t next = 0;
  int size = 0;
};

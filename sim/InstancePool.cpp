#include "sim/InstancePool.hpp"

#include "core/Log.hpp"
#include <algorithm>

InstancePoolRegistry::PoolEntry &
InstancePoolRegistry::CreateEntry(const std::string &variantKey) {
  PoolEntry &entry = pools[variantKey];
  entry.generation = nextGeneration++;
  return entry;
}

PooledInstance *InstancePoolRegistry::Construct(const std::string &variantKey,
                                                PoolEntry &entry) {
  auto instance = std::make_unique<PooledInstance>();
  instance->id = nextId++;
  instance->variantKey = variantKey;
  instance->poolGeneration = entry.generation;
  ++entry.created;

  PooledInstance *raw = instance.get();
  instances.emplace(raw->id, std::move(instance));
  return raw;
}

bool InstancePoolRegistry::InitializePool(const std::string &variantKey,
                                          int size) {
  if (pools.count(variantKey) != 0) {
    LOG_WARN("[Pool] Pool already exists for '{}'", variantKey);
    return false;
  }

  PoolEntry &entry = CreateEntry(variantKey);
  for (int i = 0; i < size; ++i) {
    PooledInstance *instance = Construct(variantKey, entry);
    instance->active = false;
    instance->available = true;
    entry.available.push_back(instance);
  }

  LOG_DEBUG("[Pool] Created pool '{}' with {} instances", variantKey, size);
  return true;
}

PooledInstance *InstancePoolRegistry::Acquire(const std::string &variantKey) {
  auto it = pools.find(variantKey);
  if (it == pools.end()) {
    LOG_WARN("[Pool] No pool for '{}', creating on demand", variantKey);
    CreateEntry(variantKey);
    it = pools.find(variantKey);
  }
  PoolEntry &entry = it->second;

  PooledInstance *instance = nullptr;
  if (!entry.available.empty()) {
    instance = entry.available.front();
    entry.available.pop_front();
  } else {
    instance = Construct(variantKey, entry);
    LOG_WARN("[Pool] Pool '{}' exhausted, grew to {} instances", variantKey,
             entry.created);
  }

  ++entry.inUse;
  instance->available = false;
  instance->active = true;
  return instance;
}

void InstancePoolRegistry::Release(InstanceId id) {
  if (id == kInvalidInstance) {
    return;
  }
  const auto found = instances.find(id);
  if (found == instances.end()) {
    LOG_DEBUG("[Pool] Release of unknown instance {} dropped", id);
    return;
  }

  PooledInstance *instance = found->second.get();
  if (instance->available) {
    return;
  }

  instance->active = false;
  instance->available = true;
  instance->scheduler = nullptr;

  auto it = pools.find(instance->variantKey);
  if (it == pools.end()) {
    LOG_DEBUG("[Pool] Recreating pool '{}' on release", instance->variantKey);
    CreateEntry(instance->variantKey);
    it = pools.find(instance->variantKey);
  }
  PoolEntry &entry = it->second;

  if (instance->poolGeneration == entry.generation) {
    --entry.inUse;
  } else {
    // Outlived a cleared pool: the new pool adopts it.
    instance->poolGeneration = entry.generation;
    ++entry.created;
  }
  entry.available.push_back(instance);
}

void InstancePoolRegistry::ClearPool(const std::string &variantKey) {
  const auto it = pools.find(variantKey);
  if (it == pools.end()) {
    return;
  }

  for (PooledInstance *instance : it->second.available) {
    instances.erase(instance->id);
  }
  LOG_DEBUG("[Pool] Cleared pool '{}' ({} idle destroyed, {} in use kept)",
            variantKey, it->second.available.size(), it->second.inUse);
  pools.erase(it);
}

void InstancePoolRegistry::ClearAll() {
  for (const auto &key : GetPoolKeys()) {
    ClearPool(key);
  }
}

bool InstancePoolRegistry::HasPool(const std::string &variantKey) const {
  return pools.count(variantKey) != 0;
}

PooledInstance *InstancePoolRegistry::Find(InstanceId id) {
  const auto it = instances.find(id);
  return it == instances.end() ? nullptr : it->second.get();
}

const PooledInstance *InstancePoolRegistry::Find(InstanceId id) const {
  const auto it = instances.find(id);
  return it == instances.end() ? nullptr : it->second.get();
}

PoolStats InstancePoolRegistry::GetStats(const std::string &variantKey) const {
  PoolStats stats;
  const auto it = pools.find(variantKey);
  if (it != pools.end()) {
    stats.available = static_cast<int>(it->second.available.size());
    stats.inUse = it->second.inUse;
    stats.created = it->second.created;
  }
  return stats;
}

int InstancePoolRegistry::GetTotalAvailable() const {
  int total = 0;
  for (const auto &kv : pools) {
    total += static_cast<int>(kv.second.available.size());
  }
  return total;
}

std::vector<std::string> InstancePoolRegistry::GetPoolKeys() const {
  std::vector<std::string> keys;
  keys.reserve(pools.size());
  for (const auto &kv : pools) {
    keys.push_back(kv.first);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::string InstancePoolRegistry::Describe() const {
  return fmt::format("Pools: {}, Objects: {}", pools.size(),
                     GetTotalAvailable());
}

PoolWarmup::PoolWarmup(std::vector<std::string> variantKeys, int sizePerVariant)
    : keys(std::move(variantKeys)), size(sizePerVariant) {}

bool PoolWarmup::Step(InstancePoolRegistry &registry) {
  while (next < keys.size() && registry.HasPool(keys[next])) {
    ++next;
  }
  if (next < keys.size()) {
    const bool created = registry.InitializePool(keys[next], size);
    if (created) {
      LOG_DEBUG("[Pool] Warm-up built '{}' ({} left)", keys[next],
                keys.size() - next - 1);
    }
    ++next;
  }
  return !IsDone();
}

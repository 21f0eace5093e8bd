#include "sim/SafeZonePolicy.hpp"

#include <algorithm>

const char *GetSafeReasonLabel(SafeReason reason) {
  switch (reason) {
  case SafeReason::ExplicitFlag:
    return "authored safe section";
  case SafeReason::FirstSegment:
    return "first section (tutorial)";
  case SafeReason::GoalBand:
    return "goal safe zone";
  default:
    return "none";
  }
}

SafeZonePolicy::SafeZonePolicy(const SpawnConfig &config,
                               std::optional<float> goalPosition)
    : bandDistance(config.goalSafeZoneDistance),
      forceFirstSegmentSafe(config.forceFirstSegmentSafe),
      clearCoins(config.clearCoinsInSafeZone),
      clearSupportItems(config.clearSupportItemsInSafeZone),
      startDifficulty(config.startDifficulty),
      maxDifficulty(std::max(config.maxDifficulty, config.startDifficulty)),
      segmentsPerIncrease(std::max(config.segmentsPerDifficultyIncrease, 1)) {
  // A non-positive goal is the open-ended sentinel used by callers that
  // have no finish line.
  if (goalPosition.has_value() && *goalPosition > 0.0f) {
    goal = goalPosition;
  }
}

bool SafeZonePolicy::IsInGoalBand(float position) const {
  if (!goal.has_value()) {
    return false;
  }
  const float distanceToGoal = *goal - position;
  return distanceToGoal <= bandDistance && distanceToGoal > 0.0f;
}

SafeReason SafeZonePolicy::GetSafeReason(float position, int segmentsSpawned,
                                         bool explicitFlag) const {
  if (explicitFlag) {
    return SafeReason::ExplicitFlag;
  }
  if (forceFirstSegmentSafe && segmentsSpawned == 0) {
    return SafeReason::FirstSegment;
  }
  if (IsInGoalBand(position)) {
    return SafeReason::GoalBand;
  }
  return SafeReason::None;
}

bool SafeZonePolicy::IsSafe(float position, int segmentsSpawned,
                            bool explicitFlag) const {
  return GetSafeReason(position, segmentsSpawned, explicitFlag) !=
         SafeReason::None;
}

int SafeZonePolicy::CurrentDifficulty(int segmentsSpawned) const {
  const int steps = std::max(segmentsSpawned, 0) / segmentsPerIncrease;
  return std::min(startDifficulty + steps, maxDifficulty);
}

bool SafeZonePolicy::ShouldSpawnCoins(bool isSafe) const {
  return !(isSafe && clearCoins);
}

bool SafeZonePolicy::ShouldSpawnSupportItems(bool isSafe) const {
  return !(isSafe && clearSupportItems);
}

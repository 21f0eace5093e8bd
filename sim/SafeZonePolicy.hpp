#pragma once

#include "core/Config.hpp"
#include <optional>

enum class SafeReason : int {
  None = 0,
  ExplicitFlag = 1, // authored isSafeZone
  FirstSegment = 2, // tutorial start
  GoalBand = 3      // inside the band right before the goal
};

const char *GetSafeReasonLabel(SafeReason reason);

// Decides where hazards are suppressed and which difficulty tier applies.
// The goal is read once at construction; std::nullopt means open-ended play.
class SafeZonePolicy {
public:
  SafeZonePolicy(const SpawnConfig &config, std::optional<float> goalPosition);

  bool IsSafe(float position, int segmentsSpawned, bool explicitFlag) const;
  SafeReason GetSafeReason(float position, int segmentsSpawned,
                           bool explicitFlag) const;

  // 0 < goal - position <= band. Always false in open-ended mode.
  bool IsInGoalBand(float position) const;

  // start + segmentsSpawned / perIncrease, capped at max.
  int CurrentDifficulty(int segmentsSpawned) const;

  // Hazards are always suppressed in a safe segment; collectibles only when
  // the matching toggle is on.
  bool ShouldSpawnObstacles(bool isSafe) const { return !isSafe; }
  bool ShouldSpawnCoins(bool isSafe) const;
  bool ShouldSpawnSupportItems(bool isSafe) const;

  bool HasGoal() const { return goal.has_value(); }
  float GetGoal() const { return goal.value_or(0.0f); }
  float GetBandDistance() const { return bandDistance; }
  // First position inside the goal band (goal - band).
  float GetBandStart() const { return GetGoal() - bandDistance; }

private:
  std::optional<float> goal;
  float bandDistance = cfg::kGoalSafeZoneDistance;
  bool forceFirstSegmentSafe = cfg::kForceFirstSegmentSafe;
  bool clearCoins = cfg::kClearCoinsInSafeZone;
  bool clearSupportItems = cfg::kClearSupportItemsInSafeZone;
  int startDifficulty = cfg::kStartDifficulty;
  int maxDifficulty = cfg::kMaxDifficulty;
  int segmentsPerIncrease = cfg::kSegmentsPerDifficultyIncrease;
};

#pragma once

#include "sim/ObstacleType.hpp"
#include <cstdint>

// Lane legality for obstacle placement. Vehicles, street vendors and road
// barriers are kept out of the center lane; everything else may go anywhere.
struct LaneRestrictionValidator {
  static bool IsCenterLaneRestricted(ObstacleType type);

  static bool IsAllowed(ObstacleType type, int lane);

  // Center lane -> random outer lane (0 or 2). Any other lane is returned
  // unchanged.
  static int Remap(int lane, uint32_t &rngState);

  // IsAllowed + Remap in one step.
  static int Resolve(ObstacleType type, int lane, uint32_t &rngState);
};

// World X of a lane center, lane 1 at x = 0.
float LaneToX(int lane, float laneDistance);

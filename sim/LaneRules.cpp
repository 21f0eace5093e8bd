#include "sim/LaneRules.hpp"

#include "core/Config.hpp"
#include "core/Rng.hpp"

bool LaneRestrictionValidator::IsCenterLaneRestricted(ObstacleType type) {
  return type == ObstacleType::Car || type == ObstacleType::Motorcycle ||
         type == ObstacleType::StreetVendor || type == ObstacleType::Barrier;
}

bool LaneRestrictionValidator::IsAllowed(ObstacleType type, int lane) {
  return !(lane == cfg::kCenterLane && IsCenterLaneRestricted(type));
}

int LaneRestrictionValidator::Remap(int lane, uint32_t &rngState) {
  if (lane != cfg::kCenterLane) {
    return lane;
  }
  return (core::NextU32(rngState) & 1u) == 0u ? 0 : cfg::kLaneCount - 1;
}

int LaneRestrictionValidator::Resolve(ObstacleType type, int lane,
                                      uint32_t &rngState) {
  if (IsAllowed(type, lane)) {
    return lane;
  }
  return Remap(lane, rngState);
}

float LaneToX(int lane, float laneDistance) {
  return static_cast<float>(lane - cfg::kCenterLane) * laneDistance;
}

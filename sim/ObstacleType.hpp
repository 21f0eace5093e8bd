#pragma once

#include <string>
#include <vector>

// Semantic obstacle types resolved from variant names.
enum class ObstacleType : int {
  // Hazardous (terminate the run on contact)
  Car = 0,
  Motorcycle = 1,
  Fence = 2,
  Barrier = 3,
  // Speed reducing
  StreetVendor = 4,
  TrashCan = 5,
  Human = 6,
  ShoppingCart = 7,
  // Generic fallbacks
  GenericBarrier = 8,
  GenericLow = 9,
  GenericHigh = 10
};

enum class BehaviorClass : int { Hazardous = 0, SpeedReducing = 1 };

struct VariantRecord {
  ObstacleType type = ObstacleType::GenericBarrier;
  BehaviorClass behavior = BehaviorClass::Hazardous;
  std::string displayName;
  float speedMultiplier = 0.0f; // SpeedReducing only (0.5 = half speed)
  float duration = 0.0f;        // seconds, SpeedReducing only
};

const char *GetObstacleTypeLabel(ObstacleType type);
const char *GetBehaviorClassLabel(BehaviorClass behavior);

// Maps variant identities to obstacle types and obstacle types to their
// gameplay record.
class VariantClassificationTable {
public:
  VariantClassificationTable(); // seeded with the default records

  // Case-folds, strips pooling/clone markers, then applies substring rules
  // from most to least specific. Unmatched names yield GenericBarrier.
  static ObstacleType ResolveType(const std::string &variantIdentity);
  static std::string NormalizeIdentity(const std::string &variantIdentity);

  // Never fails: unknown types get a Hazardous record with zero
  // multiplier/duration and the gap is logged once.
  VariantRecord GetRecord(ObstacleType type) const;

  bool IsHazardous(ObstacleType type) const;
  bool IsSpeedReducing(ObstacleType type) const;

  // Replace the table with the records from a JSON document:
  //   {"types": [{"type": "Human", "behavior": "SpeedReducing",
  //               "displayName": "...", "speedMultiplier": 0.5,
  //               "duration": 2.5}]}
  // An empty result re-seeds the defaults.
  bool LoadFromString(const std::string &text);
  bool LoadFromFile(const char *relativePath);

  void ResetToDefaults();
  void SetRecord(const VariantRecord &record);
  void RemoveRecord(ObstacleType type);
  size_t GetRecordCount() const { return records.size(); }

private:
  std::vector<VariantRecord> records;
  mutable std::vector<ObstacleType> reportedGaps;
};

#pragma once

#include <string>
#include <vector>

// Authored track content. Loaded once by the ContentCatalog and never
// mutated afterwards; ActiveSegments refer back to these by pointer.

// An obstacle to place. `category` is the authored variant category
// ("car", "fence", ... or the generic "barrier"/"low"/"high").
struct ObstaclePlacement {
  std::string category;
  int lane = 1;          // 0..2
  float zOffset = 0.0f;  // forward offset within the segment
  float yOffset = 0.0f;  // vertical offset
};

// A straight line of coins along one lane.
struct CoinGroupPlacement {
  std::string pattern = "vertical_line"; // only pattern the engine expands
  int lane = 1;
  float zStart = 0.0f;
  int count = 0;
  float spacing = 0.0f;
};

// A support item slot; the concrete kind is rolled at spawn time.
struct SupportItemPlacement {
  int lane = 1;
  float zOffset = 0.0f;
};

struct SegmentDefinition {
  std::string id;
  std::string name;
  float length = 0.0f;
  int difficulty = 1;
  bool isSafeZone = false; // authored: never spawn hazards here
  std::vector<ObstaclePlacement> obstacles;
  std::vector<CoinGroupPlacement> coins;
  std::vector<SupportItemPlacement> supportItems;
};

// Header block of a section library document.
struct CatalogMetadata {
  std::string version;
  int totalSections = 0; // count hint, checked against the parsed list
};

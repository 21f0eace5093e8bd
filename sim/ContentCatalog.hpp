#pragma once

#include "sim/SegmentData.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

using SegmentPtr = std::shared_ptr<const SegmentDefinition>;

// Library of authored segment definitions, indexed by difficulty tier.
// Definitions are shared so active segments keep theirs alive across a
// catalog reload.
//
// Documents look like:
//   {"sectionLibrary": {"metadata": {"version": "1.0", "totalSections": 2},
//                       "sections": [{"id": "s1", "length": 40, ...}]}}
class ContentCatalog {
public:
  // Loads assets/sections/<name>.json.
  bool Load(const std::string &name);
  bool LoadFromFile(const std::string &path);
  bool LoadFromString(const std::string &text,
                      const std::string &sourceName = "<memory>");

  // Uniform pick among definitions with difficulty <= maxDifficulty. Falls
  // back to a uniform pick over the whole catalog when none qualify.
  // Returns nullptr only when the catalog is empty.
  SegmentPtr GetSegment(int maxDifficulty, uint32_t &rngState) const;

  SegmentPtr GetSegmentById(const std::string &id) const;
  std::vector<SegmentPtr> GetSegmentsByDifficulty(int difficulty) const;

  // Logs every offending field. Never mutates or unloads anything.
  bool Validate() const;

  void DescribeAll() const;

  bool IsLoaded() const { return loaded; }
  int GetSegmentCount() const { return static_cast<int>(segments.size()); }
  const std::string &GetVersion() const { return metadata.version; }
  const std::string &GetSourceName() const { return sourceName; }

private:
  void IndexByDifficulty();

  std::vector<SegmentPtr> segments;
  std::map<int, std::vector<size_t>> byDifficulty;
  CatalogMetadata metadata{};
  std::string sourceName;
  bool loaded = false;
};

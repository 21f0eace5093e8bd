#include "sim/ContentCatalog.hpp"

#include "core/Assets.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

ObstaclePlacement ParseObstacle(const json &o) {
  ObstaclePlacement p;
  p.category = o.value("type", std::string{});
  p.lane = o.value("lane", 1);
  p.zOffset = o.value("zPosition", 0.0f);
  p.yOffset = o.value("yPosition", 0.0f);
  return p;
}

CoinGroupPlacement ParseCoinGroup(const json &c) {
  CoinGroupPlacement p;
  p.pattern = c.value("pattern", std::string("vertical_line"));
  p.lane = c.value("lane", 1);
  p.zStart = c.value("zStart", 0.0f);
  p.count = c.value("count", 0);
  p.spacing = c.value("spacing", 0.0f);
  return p;
}

SupportItemPlacement ParseSupportItem(const json &s) {
  SupportItemPlacement p;
  p.lane = s.value("lane", 1);
  p.zOffset = s.value("zPosition", 0.0f);
  return p;
}

SegmentDefinition ParseSegment(const json &s) {
  SegmentDefinition def;
  def.id = s.value("id", std::string{});
  def.name = s.value("name", std::string{});
  def.length = s.value("length", 0.0f);
  def.difficulty = s.value("difficulty", 1);
  def.isSafeZone = s.value("isSafeZone", false);

  if (s.contains("obstacles") && s["obstacles"].is_array()) {
    for (const auto &o : s["obstacles"]) {
      def.obstacles.push_back(ParseObstacle(o));
    }
  }
  if (s.contains("coins") && s["coins"].is_array()) {
    for (const auto &c : s["coins"]) {
      def.coins.push_back(ParseCoinGroup(c));
    }
  }
  if (s.contains("supportItems") && s["supportItems"].is_array()) {
    for (const auto &i : s["supportItems"]) {
      def.supportItems.push_back(ParseSupportItem(i));
    }
  }
  return def;
}

bool IsValidLane(int lane) { return lane >= 0 && lane <= 2; }

} // namespace

bool ContentCatalog::Load(const std::string &name) {
  return LoadFromFile(assets::SectionPath(name));
}

bool ContentCatalog::LoadFromFile(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    LOG_ERROR("[Catalog] Cannot find section library: {}", path);
    return false;
  }

  std::stringstream buffer;
  buffer << f.rdbuf();
  return LoadFromString(buffer.str(), path);
}

bool ContentCatalog::LoadFromString(const std::string &text,
                                    const std::string &source) {
  // Parse into locals first so a failed reload keeps the previous library.
  std::vector<SegmentPtr> parsed;
  CatalogMetadata meta{};

  try {
    const json data = json::parse(text);

    if (!data.contains("sectionLibrary") ||
        !data["sectionLibrary"].is_object()) {
      LOG_ERROR("[Catalog] {}: missing 'sectionLibrary' object", source);
      return false;
    }
    const auto &library = data["sectionLibrary"];

    if (!library.contains("sections") || !library["sections"].is_array()) {
      LOG_ERROR("[Catalog] {}: missing 'sections' array", source);
      return false;
    }

    if (library.contains("metadata")) {
      const auto &m = library["metadata"];
      meta.version = m.value("version", std::string{});
      meta.totalSections = m.value("totalSections", 0);
    }

    for (const auto &s : library["sections"]) {
      parsed.push_back(std::make_shared<const SegmentDefinition>(ParseSegment(s)));
    }
  } catch (const json::exception &e) {
    LOG_ERROR("[Catalog] JSON error in {}: {}", source, e.what());
    return false;
  }

  if (meta.totalSections != 0 &&
      meta.totalSections != static_cast<int>(parsed.size())) {
    LOG_WARN("[Catalog] {}: totalSections hint {} but {} sections parsed",
             source, meta.totalSections, parsed.size());
  }

  segments = std::move(parsed);
  metadata = meta;
  sourceName = source;
  loaded = true;
  IndexByDifficulty();

  LOG_INFO("[Catalog] Loaded {} sections from {} (version '{}')",
           segments.size(), source, metadata.version);
  return true;
}

void ContentCatalog::IndexByDifficulty() {
  byDifficulty.clear();
  for (size_t i = 0; i < segments.size(); ++i) {
    byDifficulty[segments[i]->difficulty].push_back(i);
  }
  for (const auto &kv : byDifficulty) {
    LOG_DEBUG("[Catalog]   difficulty {}: {} sections", kv.first,
              kv.second.size());
  }
}

SegmentPtr ContentCatalog::GetSegment(int maxDifficulty,
                                      uint32_t &rngState) const {
  if (segments.empty()) {
    return nullptr;
  }

  std::vector<size_t> valid;
  for (const auto &kv : byDifficulty) {
    if (kv.first > maxDifficulty) {
      break; // map is ordered by tier
    }
    valid.insert(valid.end(), kv.second.begin(), kv.second.end());
  }

  if (valid.empty()) {
    LOG_WARN("[Catalog] No sections for difficulty <= {}, picking any",
             maxDifficulty);
    const int pick =
        core::NextIndex(rngState, static_cast<int>(segments.size()));
    return segments[static_cast<size_t>(pick)];
  }

  const int pick = core::NextIndex(rngState, static_cast<int>(valid.size()));
  return segments[valid[static_cast<size_t>(pick)]];
}

SegmentPtr ContentCatalog::GetSegmentById(const std::string &id) const {
  for (const auto &s : segments) {
    if (s->id == id) {
      return s;
    }
  }
  return nullptr;
}

std::vector<SegmentPtr>
ContentCatalog::GetSegmentsByDifficulty(int difficulty) const {
  std::vector<SegmentPtr> result;
  const auto it = byDifficulty.find(difficulty);
  if (it == byDifficulty.end()) {
    return result;
  }
  for (size_t index : it->second) {
    result.push_back(segments[index]);
  }
  return result;
}

bool ContentCatalog::Validate() const {
  if (!loaded) {
    LOG_ERROR("[Catalog] No data to validate");
    return false;
  }

  bool isValid = true;

  for (const auto &ptr : segments) {
    const SegmentDefinition &s = *ptr;
    if (s.id.empty()) {
      LOG_ERROR("[Catalog] Section '{}' is missing an id", s.name);
      isValid = false;
    }
    if (s.length <= 0.0f) {
      LOG_ERROR("[Catalog] Section {} has invalid length: {}", s.id, s.length);
      isValid = false;
    }

    for (const auto &o : s.obstacles) {
      if (!IsValidLane(o.lane)) {
        LOG_WARN("[Catalog] Section {}: invalid obstacle lane {}", s.id,
                 o.lane);
        isValid = false;
      }
      if (o.zOffset < 0.0f || o.zOffset > s.length) {
        LOG_WARN("[Catalog] Section {}: obstacle z out of bounds: {}", s.id,
                 o.zOffset);
        isValid = false;
      }
      if (o.category.empty()) {
        LOG_WARN("[Catalog] Section {}: obstacle without a type", s.id);
        isValid = false;
      }
    }

    for (const auto &c : s.coins) {
      if (c.count <= 0) {
        LOG_WARN("[Catalog] Section {}: invalid coin count: {}", s.id,
                 c.count);
        isValid = false;
      }
      if (!IsValidLane(c.lane)) {
        LOG_WARN("[Catalog] Section {}: invalid coin lane {}", s.id, c.lane);
        isValid = false;
      }
      if (c.spacing < 0.0f) {
        LOG_WARN("[Catalog] Section {}: negative coin spacing {}", s.id,
                 c.spacing);
        isValid = false;
      }
      if (c.count > 0 &&
          c.zStart + static_cast<float>(c.count - 1) * c.spacing > s.length) {
        LOG_WARN("[Catalog] Section {}: coin line runs past section end",
                 s.id);
        isValid = false;
      }
    }

    for (const auto &i : s.supportItems) {
      if (!IsValidLane(i.lane)) {
        LOG_WARN("[Catalog] Section {}: invalid support item lane {}", s.id,
                 i.lane);
        isValid = false;
      }
      if (i.zOffset < 0.0f || i.zOffset > s.length) {
        LOG_WARN("[Catalog] Section {}: support item z out of bounds: {}",
                 s.id, i.zOffset);
        isValid = false;
      }
    }
  }

  if (isValid) {
    LOG_INFO("[Catalog] All {} sections validated", segments.size());
  }
  return isValid;
}

void ContentCatalog::DescribeAll() const {
  if (!loaded) {
    LOG_INFO("[Catalog] No data loaded");
    return;
  }
  for (const auto &ptr : segments) {
    const SegmentDefinition &s = *ptr;
    LOG_INFO("[Catalog] id={} name='{}' difficulty={} length={} obstacles={} "
             "coins={} items={}{}",
             s.id, s.name, s.difficulty, s.length, s.obstacles.size(),
             s.coins.size(), s.supportItems.size(),
             s.isSafeZone ? " (safe)" : "");
  }
}

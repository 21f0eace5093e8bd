#include "sim/ObstacleType.hpp"

#include "core/Assets.hpp"
#include "core/Log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

struct SubstringRule {
  const char *needles[4];
  const char *exclude; // rule is skipped if the name contains this
  ObstacleType type;
};

// First match wins. "shopping" precedes "cart", which precedes "car".
constexpr SubstringRule kRules[] = {
    {{"shopping", nullptr, nullptr, nullptr}, nullptr,
     ObstacleType::ShoppingCart},
    {{"cart", nullptr, nullptr, nullptr}, nullptr, ObstacleType::ShoppingCart},
    {{"car", nullptr, nullptr, nullptr}, nullptr, ObstacleType::Car},
    {{"motorcycle", "cub", "bike", "motorbike"}, nullptr,
     ObstacleType::Motorcycle},
    {{"vendor", "street", nullptr, nullptr}, nullptr,
     ObstacleType::StreetVendor},
    {{"barrier", nullptr, nullptr, nullptr}, "generic", ObstacleType::Barrier},
    {{"fence", nullptr, nullptr, nullptr}, nullptr, ObstacleType::Fence},
    {{"trash", "can", nullptr, nullptr}, nullptr, ObstacleType::TrashCan},
    {{"human", "person", "pedestrian", nullptr}, nullptr, ObstacleType::Human},
    {{"genericlow", nullptr, nullptr, nullptr}, nullptr,
     ObstacleType::GenericLow},
    {{"generichigh", nullptr, nullptr, nullptr}, nullptr,
     ObstacleType::GenericHigh},
};

// Suffix markers appended by pooling / instantiation.
constexpr const char *kStripMarkers[] = {"_pooled", "(clone)", "_runtime"};

void EraseAll(std::string &s, const std::string &token) {
  size_t pos = s.find(token);
  while (pos != std::string::npos) {
    s.erase(pos, token.size());
    pos = s.find(token, pos);
  }
}

bool ParseType(const std::string &name, ObstacleType &out) {
  for (int i = 0; i <= static_cast<int>(ObstacleType::GenericHigh); ++i) {
    const auto t = static_cast<ObstacleType>(i);
    if (name == GetObstacleTypeLabel(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

} // namespace

const char *GetObstacleTypeLabel(ObstacleType type) {
  switch (type) {
  case ObstacleType::Car:
    return "Car";
  case ObstacleType::Motorcycle:
    return "Motorcycle";
  case ObstacleType::Fence:
    return "Fence";
  case ObstacleType::Barrier:
    return "Barrier";
  case ObstacleType::StreetVendor:
    return "StreetVendor";
  case ObstacleType::TrashCan:
    return "TrashCan";
  case ObstacleType::Human:
    return "Human";
  case ObstacleType::ShoppingCart:
    return "ShoppingCart";
  case ObstacleType::GenericBarrier:
    return "GenericBarrier";
  case ObstacleType::GenericLow:
    return "GenericLow";
  case ObstacleType::GenericHigh:
    return "GenericHigh";
  default:
    return "Unknown";
  }
}

const char *GetBehaviorClassLabel(BehaviorClass behavior) {
  return behavior == BehaviorClass::SpeedReducing ? "SpeedReducing"
                                                  : "Hazardous";
}

VariantClassificationTable::VariantClassificationTable() { ResetToDefaults(); }

void VariantClassificationTable::ResetToDefaults() {
  const auto hazardous = [](ObstacleType t, const char *name) {
    return VariantRecord{t, BehaviorClass::Hazardous, name, 0.0f, 0.0f};
  };
  const auto slowing = [](ObstacleType t, const char *name, float mult,
                          float dur) {
    return VariantRecord{t, BehaviorClass::SpeedReducing, name, mult, dur};
  };

  records = {
      hazardous(ObstacleType::Car, "Car"),
      hazardous(ObstacleType::Motorcycle, "Motorcycle"),
      hazardous(ObstacleType::Fence, "Fence"),
      hazardous(ObstacleType::Barrier, "Barrier"),
      hazardous(ObstacleType::GenericBarrier, "Generic Barrier"),
      hazardous(ObstacleType::GenericLow, "Generic Low"),
      hazardous(ObstacleType::GenericHigh, "Generic High"),
      slowing(ObstacleType::StreetVendor, "Street Vendor", 0.6f, 2.0f),
      slowing(ObstacleType::ShoppingCart, "Shopping Cart", 0.6f, 2.0f),
      slowing(ObstacleType::TrashCan, "Trash Can", 0.7f, 1.5f),
      slowing(ObstacleType::Human, "Human", 0.5f, 2.5f),
  };
  reportedGaps.clear();
}

std::string
VariantClassificationTable::NormalizeIdentity(const std::string &identity) {
  std::string name = identity;
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const char *marker : kStripMarkers) {
    EraseAll(name, marker);
  }
  name.erase(std::remove_if(name.begin(), name.end(),
                            [](unsigned char c) {
                              return c == '_' || std::isspace(c) != 0;
                            }),
             name.end());
  return name;
}

ObstacleType
VariantClassificationTable::ResolveType(const std::string &variantIdentity) {
  const std::string name = NormalizeIdentity(variantIdentity);
  if (name.empty()) {
    return ObstacleType::GenericBarrier;
  }

  for (const auto &rule : kRules) {
    if (rule.exclude != nullptr && name.find(rule.exclude) != std::string::npos) {
      continue;
    }
    for (const char *needle : rule.needles) {
      if (needle != nullptr && name.find(needle) != std::string::npos) {
        return rule.type;
      }
    }
  }
  return ObstacleType::GenericBarrier;
}

VariantRecord VariantClassificationTable::GetRecord(ObstacleType type) const {
  for (const auto &record : records) {
    if (record.type == type) {
      return record;
    }
  }

  if (std::find(reportedGaps.begin(), reportedGaps.end(), type) ==
      reportedGaps.end()) {
    LOG_WARN("[Classification] {} not in table, treating as hazardous",
             GetObstacleTypeLabel(type));
    reportedGaps.push_back(type);
  }

  VariantRecord fallback;
  fallback.type = type;
  fallback.behavior = BehaviorClass::Hazardous;
  fallback.displayName = std::string(GetObstacleTypeLabel(type)) + " (default)";
  return fallback;
}

bool VariantClassificationTable::IsHazardous(ObstacleType type) const {
  return GetRecord(type).behavior == BehaviorClass::Hazardous;
}

bool VariantClassificationTable::IsSpeedReducing(ObstacleType type) const {
  return GetRecord(type).behavior == BehaviorClass::SpeedReducing;
}

void VariantClassificationTable::SetRecord(const VariantRecord &record) {
  for (auto &existing : records) {
    if (existing.type == record.type) {
      existing = record;
      return;
    }
  }
  records.push_back(record);
}

void VariantClassificationTable::RemoveRecord(ObstacleType type) {
  records.erase(std::remove_if(records.begin(), records.end(),
                               [type](const VariantRecord &r) {
                                 return r.type == type;
                               }),
                records.end());
}

bool VariantClassificationTable::LoadFromString(const std::string &text) {
  std::vector<VariantRecord> parsed;
  try {
    const json data = json::parse(text);
    if (!data.contains("types") || !data["types"].is_array()) {
      LOG_ERROR("[Classification] Missing 'types' array");
      return false;
    }

    for (const auto &t : data["types"]) {
      VariantRecord record;
      const std::string typeName = t.value("type", std::string{});
      if (!ParseType(typeName, record.type)) {
        LOG_WARN("[Classification] Unknown obstacle type '{}' skipped",
                 typeName);
        continue;
      }
      record.behavior = t.value("behavior", std::string("Hazardous")) ==
                                "SpeedReducing"
                            ? BehaviorClass::SpeedReducing
                            : BehaviorClass::Hazardous;
      record.displayName = t.value("displayName", typeName);
      if (record.behavior == BehaviorClass::SpeedReducing) {
        record.speedMultiplier =
            std::clamp(t.value("speedMultiplier", 0.5f), 0.1f, 1.0f);
        record.duration = t.value("duration", 2.0f);
      }
      parsed.push_back(record);
    }
  } catch (const json::exception &e) {
    LOG_ERROR("[Classification] JSON error: {}", e.what());
    return false;
  }

  if (parsed.empty()) {
    LOG_WARN("[Classification] Table empty, using defaults");
    ResetToDefaults();
    return true;
  }

  records = std::move(parsed);
  reportedGaps.clear();
  LOG_INFO("[Classification] Loaded {} obstacle type records", records.size());
  return true;
}

bool VariantClassificationTable::LoadFromFile(const char *relativePath) {
  const std::string fullPath = assets::Path(relativePath);
  std::ifstream f(fullPath);
  if (!f.is_open()) {
    LOG_WARN("[Classification] {} not found, using defaults", fullPath);
    return false;
  }

  std::stringstream buffer;
  buffer << f.rdbuf();
  return LoadFromString(buffer.str());
}

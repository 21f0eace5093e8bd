#include "sim/VariantSet.hpp"

#include "core/Assets.hpp"
#include "core/Log.hpp"
#include "core/Rng.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string ToLowerTrimmed(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (!std::isspace(c)) {
      out.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return out;
}

const std::vector<std::string> kNoVariants;

} // namespace

VariantCategory ParseVariantCategory(const std::string &name) {
  const std::string n = ToLowerTrimmed(name);
  if (n == "car")
    return VariantCategory::Car;
  if (n == "motorcycle" || n == "bike" || n == "motorbike")
    return VariantCategory::Motorcycle;
  if (n == "vendor" || n == "streetvendor")
    return VariantCategory::StreetVendor;
  if (n == "fence")
    return VariantCategory::Fence;
  if (n == "trashcan" || n == "trash")
    return VariantCategory::TrashCan;
  if (n == "human" || n == "pedestrian" || n == "person")
    return VariantCategory::Human;
  if (n == "shoppingcart" || n == "cart")
    return VariantCategory::ShoppingCart;
  if (n == "barrier")
    return VariantCategory::Barrier;
  return VariantCategory::None;
}

const char *GetVariantCategoryName(VariantCategory category) {
  switch (category) {
  case VariantCategory::Car:
    return "car";
  case VariantCategory::Motorcycle:
    return "motorcycle";
  case VariantCategory::StreetVendor:
    return "vendor";
  case VariantCategory::Fence:
    return "fence";
  case VariantCategory::TrashCan:
    return "trashcan";
  case VariantCategory::Human:
    return "human";
  case VariantCategory::ShoppingCart:
    return "shoppingcart";
  case VariantCategory::Barrier:
    return "barrier";
  default:
    return "";
  }
}

const char *GetGenericFallbackVariant(const std::string &category) {
  const std::string n = ToLowerTrimmed(category);
  if (n == "high" || n == "car" || n == "motorcycle" || n == "bike") {
    return kGenericHighVariant;
  }
  if (n == "low" || n == "streetvendor" || n == "vendor" ||
      n == "shoppingcart" || n == "cart" || n == "human" ||
      n == "pedestrian" || n == "trashcan" || n == "trash") {
    return kGenericLowVariant;
  }
  return kGenericBarrierVariant;
}

const std::vector<std::string> &
VariantSet::GetVariants(VariantCategory category) const {
  if (category == VariantCategory::None) {
    return kNoVariants;
  }
  return variants[static_cast<int>(category)];
}

std::string VariantSet::GetRandomVariant(const std::string &category,
                                         uint32_t &rngState) const {
  const auto &list = GetVariants(ParseVariantCategory(category));
  if (list.empty()) {
    return {};
  }
  return list[static_cast<size_t>(
      core::NextIndex(rngState, static_cast<int>(list.size())))];
}

bool VariantSet::HasCategory(const std::string &category) const {
  return !GetVariants(ParseVariantCategory(category)).empty();
}

std::vector<std::string> VariantSet::AvailableCategories() const {
  std::vector<std::string> result;
  for (int i = 0; i < kVariantCategoryCount; ++i) {
    if (!variants[i].empty()) {
      result.emplace_back(
          GetVariantCategoryName(static_cast<VariantCategory>(i)));
    }
  }
  return result;
}

std::vector<std::string> VariantSet::AllVariantKeys() const {
  std::vector<std::string> keys;
  for (const auto &list : variants) {
    for (const auto &key : list) {
      if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(key);
      }
    }
  }
  return keys;
}

bool VariantSet::IsEmpty() const {
  for (const auto &list : variants) {
    if (!list.empty()) {
      return false;
    }
  }
  return true;
}

void VariantSet::Add(VariantCategory category, const std::string &variantKey) {
  if (category == VariantCategory::None || variantKey.empty()) {
    return;
  }
  variants[static_cast<int>(category)].push_back(variantKey);
}

bool LoadVariantSetFromString(VariantSet &set, const std::string &text) {
  VariantSet parsed;
  try {
    const json data = json::parse(text);
    parsed.id = data.value("id", std::string{});
    parsed.name = data.value("name", parsed.id);

    if (data.contains("variants") && data["variants"].is_object()) {
      for (const auto &item : data["variants"].items()) {
        const VariantCategory category = ParseVariantCategory(item.key());
        if (category == VariantCategory::None) {
          LOG_WARN("[VariantSet] '{}': unknown category '{}'", parsed.id,
                   item.key());
          continue;
        }
        for (const auto &key : item.value()) {
          parsed.Add(category, key.get<std::string>());
        }
      }
    }
  } catch (const json::exception &e) {
    LOG_ERROR("[VariantSet] JSON error: {}", e.what());
    return false;
  }

  if (parsed.IsEmpty()) {
    LOG_WARN("[VariantSet] '{}' has no obstacle variants", parsed.id);
  }
  set = std::move(parsed);
  return true;
}

bool LoadVariantSetFromFile(VariantSet &set, const char *relativePath) {
  const std::string fullPath = assets::Path(relativePath);
  std::ifstream f(fullPath);
  if (!f.is_open()) {
    LOG_ERROR("[VariantSet] Failed to open {}", fullPath);
    return false;
  }
  std::stringstream buffer;
  buffer << f.rdbuf();
  return LoadVariantSetFromString(set, buffer.str());
}

#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Obstacle categories a variant set can provide.
enum class VariantCategory : int {
  None = -1,
  Car = 0,
  Motorcycle = 1,
  StreetVendor = 2,
  Fence = 3,
  TrashCan = 4,
  Human = 5,
  ShoppingCart = 6,
  Barrier = 7
};

constexpr int kVariantCategoryCount = 8;

// Authored category name (with aliases) -> category. Case-insensitive.
VariantCategory ParseVariantCategory(const std::string &name);
const char *GetVariantCategoryName(VariantCategory category);

// Generic variants used when the active set has nothing for a category.
constexpr const char *kGenericBarrierVariant = "generic_barrier";
constexpr const char *kGenericLowVariant = "generic_low";
constexpr const char *kGenericHighVariant = "generic_high";

// Maps any authored obstacle category onto one of the generic variants.
const char *GetGenericFallbackVariant(const std::string &category);

// A map-specific set of interchangeable obstacle variants.
//   {"id": "city", "name": "City Streets",
//    "variants": {"car": ["car_sedan", "car_taxi"], "fence": ["fence_wood"]}}
struct VariantSet {
  std::string id;
  std::string name;
  std::vector<std::string> variants[kVariantCategoryCount];

  // Uniform pick. Empty string when the category has no variants.
  std::string GetRandomVariant(const std::string &category,
                               uint32_t &rngState) const;

  const std::vector<std::string> &GetVariants(VariantCategory category) const;
  bool HasCategory(const std::string &category) const;
  std::vector<std::string> AvailableCategories() const;

  // Every variant key in the set, in category order.
  std::vector<std::string> AllVariantKeys() const;
  bool IsEmpty() const;

  void Add(VariantCategory category, const std::string &variantKey);
};

bool LoadVariantSetFromString(VariantSet &set, const std::string &text);
bool LoadVariantSetFromFile(VariantSet &set, const char *relativePath);

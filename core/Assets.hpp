#pragma once

#include <string>

// Asset path helpers for authored data (section libraries, variant sets,
// spawner config). Paths resolve against the nearest "assets" directory
// found from the working directory upward.
//
// Usage:
//   catalog.LoadFromFile(assets::Path("sections/sections.json"));
//   assets::SectionPath("city") -> ".../assets/sections/city.json"

namespace assets {

// Returns "<assets dir>/<relative>". The pointer stays valid until the next
// call on the same thread.
const char* Path(const char* relative);

// Well-known location of a named section library.
std::string SectionPath(const std::string& name);

// Convenience: check if an asset file exists before loading.
bool Exists(const char* relative);

}  // namespace assets

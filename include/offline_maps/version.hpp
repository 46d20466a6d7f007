// === Version Metadata ========================================================
//
// Exposes the engine's semantic version string used in logs and the default
// HTTP user agent.

#pragma once

#include <string_view>

namespace offline_maps {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace offline_maps

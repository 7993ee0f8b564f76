// === Version Metadata ========================================================
//
// Exposes the tracker's semantic version string used in logs and API output.

#pragma once

#include <string_view>

namespace beacon_presence {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace beacon_presence

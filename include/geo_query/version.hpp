// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs and the demo.

#pragma once

#include <string_view>

namespace geo_query {

inline constexpr std::string_view k_version{"0.3.0"};

}  // namespace geo_query

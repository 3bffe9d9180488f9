// === Version Metadata ========================================================
//
// Engine version as declared by the build (project VERSION in CMakeLists.txt).

#pragma once

#include <string_view>

namespace campus_dispatch {

inline constexpr std::string_view k_version{CAMPUS_DISPATCH_VERSION};

}  // namespace campus_dispatch

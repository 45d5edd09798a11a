#pragma once

namespace brdoc::core {

// kBuildVersion is the current library version string.
// Updated once per release.
constexpr const char* kBuildVersion = "1.0";

}  // namespace brdoc::core

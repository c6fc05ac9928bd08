#pragma once

#include "pixel_forge/config.hpp"
#include "capture_platform.hpp"

#include <memory>

namespace pixel_forge {

// Create the capture platform for `type`. AUTO picks the backend matching the
// running session. Returns nullptr if the backend is not compiled in.
std::shared_ptr<CapturePlatform> create_platform(PlatformType type);

const char* to_string(PlatformType type);

}  // namespace pixel_forge

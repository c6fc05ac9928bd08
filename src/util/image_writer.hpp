#pragma once

#include "pixel_forge/config.hpp"
#include "../capture/frame.hpp"

#include <string>

namespace pixel_forge {

// Write `frame` as an uncompressed PAM (P7, RGB_ALPHA) image.
// BGRA8 frames are reordered to RGBA on the way out.
bool write_pam(const std::string& path, const MaterializedFrame& frame, PixelFormat format);

}  // namespace pixel_forge

#pragma once

#include "capture_status.hpp"
#include "../platform/capture_platform.hpp"

#include <cstdint>
#include <vector>

namespace pixel_forge {

// Uncropped readback of a surface: `height` rows of `row_pitch` bytes each
struct RawImage {
    std::vector<uint8_t> data;
    int row_pitch = 0;     // bytes per row, may include padding
    int height = 0;
};

// GPU -> CPU copy of `height` rows. Fails with FRAME_CONVERSION_FAILED if the
// platform readback fails or reports a pitch too small for `width`.
CaptureStatus read_surface(GpuSurface& surface, int width, int height, RawImage& raw);

// View `raw` as [height, row_pitch / 4, 4] and keep [0:height, 0:width, 0:4].
// The result is exactly width * height * 4 bytes.
CaptureStatus crop_to_content(const RawImage& raw, int width, int height,
                              std::vector<uint8_t>& pixels);

// Reorder R and B in place (RGBA8 <-> BGRA8)
void swap_red_blue(uint8_t* pixels, size_t pixel_count);

}  // namespace pixel_forge

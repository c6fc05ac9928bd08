#include "surface_converter.hpp"
#include "../util/logger.hpp"

#include <cstring>

namespace pixel_forge {

CaptureStatus read_surface(GpuSurface& surface, int width, int height, RawImage& raw) {
    if (width <= 0 || height <= 0) {
        LOG_ERROR("Cannot read back a %dx%d surface", width, height);
        return CaptureStatus::FRAME_CONVERSION_FAILED;
    }

    std::vector<uint8_t> data;
    int row_pitch = 0;
    if (!surface.read_back(width, height, data, row_pitch)) {
        LOG_ERROR("Surface readback failed (%dx%d)", width, height);
        return CaptureStatus::FRAME_CONVERSION_FAILED;
    }

    if (row_pitch < width * BYTES_PER_PIXEL) {
        LOG_ERROR("Row pitch %d too small for width %d", row_pitch, width);
        return CaptureStatus::FRAME_CONVERSION_FAILED;
    }

    size_t expected = static_cast<size_t>(row_pitch) * height;
    if (data.size() < expected) {
        LOG_ERROR("Readback returned %zu bytes, expected %zu", data.size(), expected);
        return CaptureStatus::FRAME_CONVERSION_FAILED;
    }
    data.resize(expected);

    raw.data = std::move(data);
    raw.row_pitch = row_pitch;
    raw.height = height;
    return CaptureStatus::OK;
}

CaptureStatus crop_to_content(const RawImage& raw, int width, int height,
                              std::vector<uint8_t>& pixels) {
    const int row_bytes = width * BYTES_PER_PIXEL;
    if (width <= 0 || height <= 0 || height > raw.height || row_bytes > raw.row_pitch ||
        raw.data.size() < static_cast<size_t>(raw.row_pitch) * height) {
        LOG_ERROR("Cannot crop %dx%d out of %d rows with pitch %d",
                  width, height, raw.height, raw.row_pitch);
        return CaptureStatus::FRAME_CONVERSION_FAILED;
    }

    pixels.resize(static_cast<size_t>(row_bytes) * height);

    if (raw.row_pitch == row_bytes) {
        memcpy(pixels.data(), raw.data.data(), pixels.size());
        return CaptureStatus::OK;
    }

    // Drop the right-edge padding of every row
    for (int y = 0; y < height; y++) {
        memcpy(pixels.data() + static_cast<size_t>(y) * row_bytes,
               raw.data.data() + static_cast<size_t>(y) * raw.row_pitch,
               row_bytes);
    }
    return CaptureStatus::OK;
}

void swap_red_blue(uint8_t* pixels, size_t pixel_count) {
    for (size_t i = 0; i < pixel_count; i++) {
        uint8_t* p = pixels + i * BYTES_PER_PIXEL;
        uint8_t r = p[0];
        p[0] = p[2];
        p[2] = r;
    }
}

}  // namespace pixel_forge

#pragma once

#include "capture_status.hpp"
#include "surface_converter.hpp"
#include "../platform/capture_platform.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace pixel_forge {

// Cropped, CPU-owned image handed to the caller
struct MaterializedFrame {
    int width = 0;
    int height = 0;
    int64_t timestamp_us = 0;
    std::vector<uint8_t> pixels;    // height * width * 4, row-major
};

// Immutable handle to one captured image. Copies share the underlying
// surface or pixel buffer.
class Frame {
public:
    enum class State {
        GPU_ONLY,       // holds only the platform surface
        MATERIALIZED    // owns a CPU buffer
    };

    Frame() = default;
    Frame(std::shared_ptr<GpuSurface> surface, int width, int height, int64_t timestamp_us);

    // Frame that already lives in CPU memory. `raw` rows may be padded.
    static Frame from_raw(RawImage raw, int width, int height, int64_t timestamp_us);
    static Frame from_raw(std::shared_ptr<const RawImage> raw, int width, int height,
                          int64_t timestamp_us);

    State state() const { return m_pixels ? State::MATERIALIZED : State::GPU_ONLY; }
    int width() const { return m_width; }
    int height() const { return m_height; }
    int64_t timestamp_us() const { return m_timestamp_us; }

    // Uncropped copy of the image, height rows of row_pitch bytes.
    // Calling it twice yields identical buffers.
    CaptureStatus materialize(RawImage& raw) const;

private:
    std::shared_ptr<GpuSurface> m_surface;
    std::shared_ptr<const RawImage> m_pixels;
    int m_width = 0;
    int m_height = 0;
    int64_t m_timestamp_us = 0;
};

}  // namespace pixel_forge

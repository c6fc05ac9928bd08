#include "frame.hpp"
#include "../util/logger.hpp"

namespace pixel_forge {

Frame::Frame(std::shared_ptr<GpuSurface> surface, int width, int height, int64_t timestamp_us)
    : m_surface(std::move(surface))
    , m_width(width)
    , m_height(height)
    , m_timestamp_us(timestamp_us) {
}

Frame Frame::from_raw(RawImage raw, int width, int height, int64_t timestamp_us) {
    return from_raw(std::make_shared<const RawImage>(std::move(raw)), width, height, timestamp_us);
}

Frame Frame::from_raw(std::shared_ptr<const RawImage> raw, int width, int height,
                      int64_t timestamp_us) {
    Frame frame;
    frame.m_pixels = std::move(raw);
    frame.m_width = width;
    frame.m_height = height;
    frame.m_timestamp_us = timestamp_us;
    return frame;
}

CaptureStatus Frame::materialize(RawImage& raw) const {
    if (m_pixels) {
        raw = *m_pixels;
        return CaptureStatus::OK;
    }

    if (!m_surface) {
        LOG_ERROR("Frame has neither a surface nor pixels");
        return CaptureStatus::FRAME_CONVERSION_FAILED;
    }

    return read_surface(*m_surface, m_width, m_height, raw);
}

}  // namespace pixel_forge

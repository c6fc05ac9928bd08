#pragma once

#include "capture_status.hpp"
#include "session_state.hpp"
#include "../platform/capture_platform.hpp"

#include <cstdint>
#include <memory>

namespace pixel_forge {

// Owns the frame pool + capture session of one capture thread and turns
// platform frame-arrived / target-closed events into mailbox updates.
// Everything except the constructor runs on the capture thread.
class FramePoolManager {
public:
    FramePoolManager(CapturePlatform& platform,
                     std::shared_ptr<GraphicsDevice> device,
                     std::shared_ptr<CaptureItem> item,
                     std::shared_ptr<SessionState> state,
                     const CaptureConfig& config);
    ~FramePoolManager();

    FramePoolManager(const FramePoolManager&) = delete;
    FramePoolManager& operator=(const FramePoolManager&) = delete;

    // Create pool and session, register handlers, start capturing
    CaptureStatus open();

    // Remove registrations, close session, close pool. Safe to call twice.
    void close();

    // Platform event handlers
    void on_frame_arrived();
    void on_item_closed();

    SizeI last_size() const { return m_last_size; }
    uint32_t resize_count() const { return m_resize_count; }
    bool is_open() const { return m_session_started; }

private:
    CapturePlatform& m_platform;
    std::shared_ptr<GraphicsDevice> m_device;
    std::shared_ptr<CaptureItem> m_item;
    std::shared_ptr<SessionState> m_state;
    CaptureConfig m_config;

    std::unique_ptr<FramePool> m_pool;
    std::unique_ptr<CaptureSession> m_session;

    EventToken m_frame_arrived_token = 0;
    EventToken m_closed_token = 0;
    bool m_frame_arrived_registered = false;
    bool m_closed_registered = false;
    bool m_session_started = false;

    SizeI m_last_size;
    uint32_t m_resize_count = 0;
};

}  // namespace pixel_forge

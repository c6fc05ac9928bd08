#include "frame_pool_manager.hpp"
#include "../util/logger.hpp"

namespace pixel_forge {

FramePoolManager::FramePoolManager(CapturePlatform& platform,
                                   std::shared_ptr<GraphicsDevice> device,
                                   std::shared_ptr<CaptureItem> item,
                                   std::shared_ptr<SessionState> state,
                                   const CaptureConfig& config)
    : m_platform(platform)
    , m_device(std::move(device))
    , m_item(std::move(item))
    , m_state(std::move(state))
    , m_config(config) {
}

FramePoolManager::~FramePoolManager() {
    close();
}

CaptureStatus FramePoolManager::open() {
    m_last_size = m_item->size();
    if (m_last_size.width <= 0 || m_last_size.height <= 0) {
        LOG_ERROR("Capture target '%s' has no size (%dx%d)",
                  m_item->display_name().c_str(), m_last_size.width, m_last_size.height);
        return CaptureStatus::TARGET_INVALID;
    }

    CaptureStatus status = m_platform.create_frame_pool(*m_device, m_config.pixel_format,
                                                        m_config.frame_pool_depth,
                                                        m_last_size, m_pool);
    if (!succeeded(status)) {
        LOG_ERROR("Failed to create frame pool: %s", to_string(status));
        return status;
    }

    m_session = m_pool->create_session(*m_item);
    if (!m_session) {
        LOG_ERROR("Failed to create capture session for '%s'", m_item->display_name().c_str());
        return CaptureStatus::SESSION_CREATION_FAILED;
    }

    m_closed_token = m_item->add_closed_handler([this]() { on_item_closed(); });
    m_closed_registered = true;

    m_frame_arrived_token = m_pool->add_frame_arrived_handler([this]() { on_frame_arrived(); });
    m_frame_arrived_registered = true;

    if (!m_session->start()) {
        LOG_ERROR("Failed to start capture session");
        return CaptureStatus::SESSION_CREATION_FAILED;
    }
    m_session_started = true;

    LOG_INFO("Capturing '%s' at %dx%d", m_item->display_name().c_str(),
             m_last_size.width, m_last_size.height);
    return CaptureStatus::OK;
}

void FramePoolManager::close() {
    if (m_frame_arrived_registered) {
        m_pool->remove_frame_arrived_handler(m_frame_arrived_token);
        m_frame_arrived_registered = false;
    }
    if (m_closed_registered) {
        m_item->remove_closed_handler(m_closed_token);
        m_closed_registered = false;
    }
    if (m_session) {
        m_session->close();
        m_session.reset();
    }
    if (m_pool) {
        m_pool->close();
        m_pool.reset();
    }
    m_session_started = false;
}

void FramePoolManager::on_frame_arrived() {
    // Teardown may be racing us; don't touch the pool or the mailbox
    if (m_state->stopping()) {
        return;
    }

    ArrivedFrame arrived;
    if (!m_pool->try_get_next_frame(arrived)) {
        return;
    }

    if (arrived.content_size != m_last_size) {
        LOG_INFO("Capture target resized %dx%d -> %dx%d, recreating frame pool",
                 m_last_size.width, m_last_size.height,
                 arrived.content_size.width, arrived.content_size.height);
        if (!m_pool->recreate(m_config.pixel_format, m_config.frame_pool_depth,
                              arrived.content_size)) {
            LOG_ERROR("Failed to recreate frame pool");
            return;
        }
        m_last_size = arrived.content_size;
        m_resize_count++;
        // The first frame at the new size comes with the next event
        return;
    }

    const int width = arrived.content_size.width;
    const int height = arrived.content_size.height;
    if (arrived.pixels) {
        m_state->mailbox.put(Frame::from_raw(std::move(arrived.pixels), width, height,
                                             arrived.timestamp_us));
    } else {
        m_state->mailbox.put(Frame(std::move(arrived.surface), width, height,
                                   arrived.timestamp_us));
    }
    m_state->frames_delivered.fetch_add(1, std::memory_order_relaxed);
}

void FramePoolManager::on_item_closed() {
    LOG_INFO("Capture target '%s' closed", m_item->display_name().c_str());
    m_state->request_stop();
}

}  // namespace pixel_forge

#include "capture_controller.hpp"
#include "frame_pool_manager.hpp"
#include "surface_converter.hpp"
#include "../platform/platform_factory.hpp"
#include "../util/logger.hpp"

#include <chrono>

namespace pixel_forge {

const char* to_string(CaptureState state) {
    switch (state) {
        case CaptureState::IDLE:     return "idle";
        case CaptureState::STARTING: return "starting";
        case CaptureState::RUNNING:  return "running";
        case CaptureState::STOPPING: return "stopping";
        case CaptureState::STOPPED:  return "stopped";
    }
    return "unknown";
}

CaptureController::CaptureController()
    : CaptureController(create_platform(PlatformType::AUTO)) {
}

CaptureController::CaptureController(std::shared_ptr<CapturePlatform> platform,
                                     const CaptureConfig& config)
    : m_platform(std::move(platform))
    , m_config(config) {
}

CaptureController::~CaptureController() {
    stop();
}

CaptureStatus CaptureController::start(const TargetSpec& target, bool await_first_frame) {
    if (active()) {
        LOG_WARN("Capture already running, stop it before starting a new one");
        return CaptureStatus::ALREADY_STARTED;
    }
    if (!m_platform) {
        LOG_ERROR("No capture platform available");
        return CaptureStatus::PLATFORM_UNAVAILABLE;
    }

    std::shared_ptr<CaptureItem> item;
    CaptureStatus status = m_platform->resolve_target(target, item);
    if (!succeeded(status)) {
        LOG_ERROR("Failed to resolve capture target: %s", to_string(status));
        return status;
    }

    return start(std::move(item), await_first_frame);
}

CaptureStatus CaptureController::start(std::shared_ptr<CaptureItem> item, bool await_first_frame) {
    if (active()) {
        LOG_WARN("Capture already running, stop it before starting a new one");
        return CaptureStatus::ALREADY_STARTED;
    }
    if (!m_platform) {
        LOG_ERROR("No capture platform available");
        return CaptureStatus::PLATFORM_UNAVAILABLE;
    }
    if (!item) {
        LOG_ERROR("Cannot start capture without a target");
        return CaptureStatus::TARGET_INVALID;
    }

    LOG_INFO("Starting %s capture of '%s'", m_platform->get_name(), item->display_name().c_str());

    auto session = std::make_shared<SessionState>();
    std::promise<CaptureStatus> started;
    std::future<CaptureStatus> started_result = started.get_future();

    m_state = CaptureState::STARTING;
    m_thread = std::thread(&CaptureController::capture_thread_main, m_platform, std::move(item),
                           session, m_config, std::move(started));

    // The capture thread reports once the session is running or setup failed
    CaptureStatus status = started_result.get();
    if (!succeeded(status)) {
        m_thread.join();
        m_state = CaptureState::IDLE;
        LOG_ERROR("Capture failed to start: %s", to_string(status));
        return status;
    }

    m_session = std::move(session);
    m_state = CaptureState::RUNNING;

    if (await_first_frame) {
        wait_for_first_frame();
    }
    return CaptureStatus::OK;
}

void CaptureController::wait_for_first_frame() const {
    const auto interval = std::chrono::milliseconds(m_config.first_frame_poll_interval_ms);
    while (!m_session->mailbox.has_value() && !m_session->stopping() &&
           !m_session->producer_responsive.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(interval);
    }

    if (!m_session->mailbox.has_value()) {
        LOG_WARN("Capture stopped before the first frame arrived");
    }
}

void CaptureController::capture_thread_main(std::shared_ptr<CapturePlatform> platform,
                                            std::shared_ptr<CaptureItem> item,
                                            std::shared_ptr<SessionState> state,
                                            CaptureConfig config,
                                            std::promise<CaptureStatus> started) {
    CaptureStatus status = platform->init_thread();
    if (!succeeded(status)) {
        LOG_ERROR("Failed to initialize %s on the capture thread", platform->get_name());
        state->producer_responsive.store(true, std::memory_order_relaxed);
        started.set_value(status);
        return;
    }

    std::unique_ptr<MessageLoop> loop = platform->create_message_loop();
    if (!loop) {
        LOG_ERROR("Failed to create message loop");
        platform->uninit_thread();
        state->producer_responsive.store(true, std::memory_order_relaxed);
        started.set_value(CaptureStatus::PLATFORM_INIT_FAILED);
        return;
    }
    state->waker = loop->waker();

    std::shared_ptr<GraphicsDevice> device;
    status = platform->create_graphics_device(*loop, device);

    if (succeeded(status)) {
        FramePoolManager manager(*platform, device, item, state, config);
        status = manager.open();

        if (succeeded(status)) {
            started.set_value(CaptureStatus::OK);

            loop->run([&state]() { return !state->stopping(); });
            if (!state->stopping()) {
                // Loop failed on its own; anyone waiting on the session must see it end
                LOG_WARN("Capture message loop exited without a stop request");
                state->stop_requested.store(true, std::memory_order_relaxed);
            }
            state->producer_responsive.store(true, std::memory_order_relaxed);
            LOG_DEBUG("Capture message loop exited");
        }

        manager.close();
    } else {
        LOG_ERROR("Failed to create graphics device: %s", to_string(status));
    }

    device.reset();
    loop.reset();
    platform->uninit_thread();
    state->producer_responsive.store(true, std::memory_order_relaxed);

    if (!succeeded(status)) {
        started.set_value(status);
    }
}

CaptureStatus CaptureController::frame(MaterializedFrame& out) const {
    if (!active() || !m_session) {
        return CaptureStatus::NOT_RUNNING;
    }

    // Only the handle copy happens under the mailbox lock
    std::optional<Frame> latest = m_session->mailbox.peek();
    if (!latest) {
        return CaptureStatus::NO_FRAME_AVAILABLE;
    }

    RawImage raw;
    CaptureStatus status = latest->materialize(raw);
    if (!succeeded(status)) {
        return status;
    }

    status = crop_to_content(raw, latest->width(), latest->height(), out.pixels);
    if (!succeeded(status)) {
        return status;
    }

    out.width = latest->width();
    out.height = latest->height();
    out.timestamp_us = latest->timestamp_us();
    return CaptureStatus::OK;
}

void CaptureController::stop() {
    if (!m_thread.joinable()) {
        if (m_session) {
            m_session->mailbox.clear();
        }
        return;
    }

    m_state = CaptureState::STOPPING;
    m_session->request_stop();

    // The loop may never see the wake message if its target vanished
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(m_config.stop_timeout_ms);
    const auto interval = std::chrono::milliseconds(m_config.stop_poll_interval_ms);
    while (!m_session->producer_responsive.load(std::memory_order_relaxed) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(interval);
    }

    if (m_session->producer_responsive.load(std::memory_order_relaxed)) {
        m_thread.join();
        LOG_INFO("Capture thread stopped");
    } else {
        LOG_WARN("Capture thread unresponsive after %d ms, detaching it", m_config.stop_timeout_ms);
        m_thread.detach();
    }

    m_session->mailbox.clear();
    m_state = CaptureState::STOPPED;
}

CaptureState CaptureController::state() const {
    CaptureState state = m_state.load();
    if (state == CaptureState::RUNNING && m_session && m_session->stopping()) {
        return CaptureState::STOPPING;
    }
    return state;
}

uint64_t CaptureController::frames_delivered() const {
    return m_session ? m_session->frames_delivered.load(std::memory_order_relaxed) : 0;
}

}  // namespace pixel_forge

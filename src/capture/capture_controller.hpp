#pragma once

#include "pixel_forge/config.hpp"
#include "capture_status.hpp"
#include "frame.hpp"
#include "session_state.hpp"
#include "../platform/capture_platform.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <thread>

namespace pixel_forge {

enum class CaptureState {
    IDLE,
    STARTING,
    RUNNING,
    STOPPING,
    STOPPED
};

const char* to_string(CaptureState state);

// Captures one monitor or window on a dedicated thread running the platform
// message loop. The latest frame is kept on the GPU and only copied to CPU
// memory when frame() is called.
//
// start/stop/destruction must come from one owning thread. frame() and the
// read-only accessors may be called from other threads as long as they do
// not race start() or stop().
class CaptureController {
public:
    // Idle controller on the platform picked by create_platform(AUTO)
    CaptureController();
    explicit CaptureController(std::shared_ptr<CapturePlatform> platform,
                               const CaptureConfig& config = CaptureConfig());
    ~CaptureController();

    CaptureController(const CaptureController&) = delete;
    CaptureController& operator=(const CaptureController&) = delete;

    // Start capturing `item`. Platform failures on the capture thread are
    // returned here. With await_first_frame, blocks until a frame is in the
    // mailbox or the session was stopped (e.g. the target closed).
    CaptureStatus start(std::shared_ptr<CaptureItem> item, bool await_first_frame = true);

    // Resolve `target` through the platform, then start
    CaptureStatus start(const TargetSpec& target, bool await_first_frame = true);

    // True while the capture thread handle is held
    bool active() const { return m_thread.joinable(); }

    // Copy the latest frame to CPU memory, cropped to its content size
    CaptureStatus frame(MaterializedFrame& out) const;

    // Request the loop to exit and join it, giving up after stop_timeout_ms
    void stop();

    CaptureState state() const;

    // Frames placed in the mailbox during the current session
    uint64_t frames_delivered() const;

    CapturePlatform& platform() { return *m_platform; }
    const CaptureConfig& config() const { return m_config; }

private:
    static void capture_thread_main(std::shared_ptr<CapturePlatform> platform,
                                    std::shared_ptr<CaptureItem> item,
                                    std::shared_ptr<SessionState> state,
                                    CaptureConfig config,
                                    std::promise<CaptureStatus> started);

    void wait_for_first_frame() const;

    std::shared_ptr<CapturePlatform> m_platform;
    CaptureConfig m_config;

    std::thread m_thread;
    std::shared_ptr<SessionState> m_session;
    std::atomic<CaptureState> m_state{CaptureState::IDLE};
};

}  // namespace pixel_forge

#pragma once

#include "frame.hpp"
#include "frame_mailbox.hpp"
#include "../platform/capture_platform.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace pixel_forge {

// State shared by one capture session's thread and its consumers. Held by
// shared_ptr on both sides so an abandoned capture thread never outlives it.
struct SessionState {
    // consumer -> producer: leave the message loop
    std::atomic<bool> stop_requested{false};

    // producer -> consumer: the message loop has returned
    std::atomic<bool> producer_responsive{false};

    std::atomic<uint64_t> frames_delivered{0};

    FrameMailbox<Frame> mailbox;

    // Written on the capture thread before the start handoff completes
    std::shared_ptr<LoopWaker> waker;

    void request_stop() {
        stop_requested.store(true, std::memory_order_relaxed);
        if (waker) {
            waker->wake();
        }
    }

    bool stopping() const { return stop_requested.load(std::memory_order_relaxed); }
};

}  // namespace pixel_forge

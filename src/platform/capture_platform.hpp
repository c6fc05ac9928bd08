#pragma once

#include "pixel_forge/config.hpp"
#include "../capture/capture_status.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pixel_forge {

struct SizeI {
    int width = 0;
    int height = 0;
};

inline bool operator==(const SizeI& a, const SizeI& b) {
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const SizeI& a, const SizeI& b) { return !(a == b); }

// Handler registration token (EventRegistrationToken on Windows)
using EventToken = int64_t;

// A compositor-owned image, usually GPU resident.
class GpuSurface {
public:
    virtual ~GpuSurface() = default;

    // Copy the first `height` rows of the surface into CPU memory.
    // `out` receives height * row_pitch bytes; row_pitch may exceed width * 4.
    // Returns false on any staging/copy/map failure.
    virtual bool read_back(int width, int height, std::vector<uint8_t>& out, int& row_pitch) = 0;

    // Allocated surface dimensions (>= content size of the frame it came from)
    virtual SizeI allocated_size() const = 0;

protected:
    GpuSurface() = default;
    GpuSurface(const GpuSurface&) = delete;
    GpuSurface& operator=(const GpuSurface&) = delete;
};

// Uncropped CPU image, defined in capture/surface_converter.hpp
struct RawImage;

// One frame fetched from a frame pool. Platforms that copy the image out
// of the compositor on arrival fill `pixels` instead of `surface`.
struct ArrivedFrame {
    std::shared_ptr<GpuSurface> surface;
    std::shared_ptr<const RawImage> pixels;
    SizeI content_size;
    int64_t timestamp_us = 0;
};

// "The thing being captured": a monitor or a window.
class CaptureItem {
public:
    virtual ~CaptureItem() = default;

    virtual SizeI size() const = 0;
    virtual std::string display_name() const = 0;

    // The handler runs on the capture thread when the target goes away
    virtual EventToken add_closed_handler(std::function<void()> handler) = 0;
    virtual void remove_closed_handler(EventToken token) = 0;

protected:
    CaptureItem() = default;
    CaptureItem(const CaptureItem&) = delete;
    CaptureItem& operator=(const CaptureItem&) = delete;
};

class CaptureSession {
public:
    virtual ~CaptureSession() = default;

    // Begin frame delivery. Called once.
    virtual bool start() = 0;

    // Stop frame delivery and release the session. Called once.
    virtual void close() = 0;

protected:
    CaptureSession() = default;
    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;
};

// OS-managed set of surfaces delivering successive frames
class FramePool {
public:
    virtual ~FramePool() = default;

    // The handler runs on the capture thread for every new frame
    virtual EventToken add_frame_arrived_handler(std::function<void()> handler) = 0;
    virtual void remove_frame_arrived_handler(EventToken token) = 0;

    // Fetch the newest frame. Returns false if none is pending.
    virtual bool try_get_next_frame(ArrivedFrame& frame) = 0;

    // Rebuild the pool for a new size. Invalidates surfaces handed out before.
    virtual bool recreate(PixelFormat format, int depth, SizeI size) = 0;

    // Bind the pool to a target. Returns nullptr on failure.
    virtual std::unique_ptr<CaptureSession> create_session(CaptureItem& item) = 0;

    virtual void close() = 0;

protected:
    FramePool() = default;
    FramePool(const FramePool&) = delete;
    FramePool& operator=(const FramePool&) = delete;
};

// Device (and context) the pool allocates surfaces with. Opaque to the core.
class GraphicsDevice {
public:
    virtual ~GraphicsDevice() = default;

protected:
    GraphicsDevice() = default;
    GraphicsDevice(const GraphicsDevice&) = delete;
    GraphicsDevice& operator=(const GraphicsDevice&) = delete;
};

// Posts the wake-up/quit message into a message loop from any thread.
// Stays valid after the loop is destroyed (posting then simply fails).
class LoopWaker {
public:
    virtual ~LoopWaker() = default;
    virtual bool wake() = 0;
};

// Cooperative message loop owned by the capture thread
class MessageLoop {
public:
    virtual ~MessageLoop() = default;

    // Pump messages on the calling thread until the wake/quit message is
    // received or `keep_running` returns false after a dispatch.
    virtual void run(const std::function<bool()>& keep_running) = 0;

    virtual std::shared_ptr<LoopWaker> waker() const = 0;

protected:
    MessageLoop() = default;
    MessageLoop(const MessageLoop&) = delete;
    MessageLoop& operator=(const MessageLoop&) = delete;
};

// Enumeration entry for --list
struct TargetInfo {
    TargetKind kind = TargetKind::MONITOR_INDEX;
    int index = 0;              // monitors: 1-based index
    uintptr_t handle = 0;
    std::string name;           // device name or window title
    std::string description;    // adapter string, class name ...
    SizeI size;
    int refresh_rate = 0;
};

// Factory for everything platform specific
class CapturePlatform {
public:
    virtual ~CapturePlatform() = default;

    // Backend name for logging
    virtual const char* get_name() const = 0;

    // Turn a target description into a capturable item. Runs on the caller's thread.
    virtual CaptureStatus resolve_target(const TargetSpec& target,
                                         std::shared_ptr<CaptureItem>& item) = 0;

    virtual std::vector<TargetInfo> enumerate_targets() = 0;

    // Per-thread subsystem setup, called on the capture thread
    virtual CaptureStatus init_thread() = 0;
    virtual void uninit_thread() = 0;

    // Called on the capture thread; the loop belongs to that thread
    virtual std::unique_ptr<MessageLoop> create_message_loop() = 0;

    virtual CaptureStatus create_graphics_device(MessageLoop& loop,
                                                 std::shared_ptr<GraphicsDevice>& device) = 0;

    virtual CaptureStatus create_frame_pool(GraphicsDevice& device, PixelFormat format,
                                            int depth, SizeI size,
                                            std::unique_ptr<FramePool>& pool) = 0;

protected:
    CapturePlatform() = default;
    CapturePlatform(const CapturePlatform&) = delete;
    CapturePlatform& operator=(const CapturePlatform&) = delete;
};

}  // namespace pixel_forge

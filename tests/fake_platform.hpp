#pragma once

#include "platform/capture_platform.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pixel_forge {
namespace fake {

// Value of byte `channel` of pixel (x, y) in surfaces filled with `seed`
inline uint8_t pattern_byte(uint8_t seed, int x, int y, int channel) {
    return static_cast<uint8_t>(seed + x * 7 + y * 13 + channel * 31);
}

// Padding bytes past the content of every row
constexpr uint8_t PADDING_BYTE = 0xEE;

// Rows are padded to 256 bytes like D3D11 staging textures
inline int padded_pitch(int width) {
    return (width * 4 + 255) / 256 * 256;
}

// Thread-safe ordered record of teardown and lifecycle events
class EventLog {
public:
    void add(const std::string& event);
    std::vector<std::string> entries() const;
    bool contains(const std::string& event) const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_entries;
};

// Surface filled with pattern_byte(); rows are padded_pitch() bytes wide
class FakeSurface : public GpuSurface {
public:
    FakeSurface(SizeI size, uint8_t seed, bool fail_reads);

    bool read_back(int width, int height, std::vector<uint8_t>& out, int& row_pitch) override;
    SizeI allocated_size() const override { return m_size; }

    int read_count() const { return m_read_count.load(); }

private:
    SizeI m_size;
    int m_pitch;
    std::vector<uint8_t> m_data;
    bool m_fail_reads;
    std::atomic<int> m_read_count{0};
};

class FakeItem : public CaptureItem {
public:
    FakeItem(SizeI size, std::string name, std::shared_ptr<EventLog> log);

    SizeI size() const override { return m_size; }
    std::string display_name() const override { return m_name; }

    EventToken add_closed_handler(std::function<void()> handler) override;
    void remove_closed_handler(EventToken token) override;

    void fire_closed();
    size_t handler_count() const;

private:
    SizeI m_size;
    std::string m_name;
    std::shared_ptr<EventLog> m_log;

    mutable std::mutex m_mutex;
    std::map<EventToken, std::function<void()>> m_handlers;
    EventToken m_next_token = 0;
};

class FakeFramePool;

// Knobs are set by the test before start()
struct FakeOptions {
    SizeI target_size = {800, 600};
    int monitor_count = 2;
    std::string window_title = "Notepad";

    CaptureStatus init_status = CaptureStatus::OK;
    CaptureStatus device_status = CaptureStatus::OK;
    bool fail_loop = false;
    bool fail_session_creation = false;
    bool fail_session_start = false;
    bool fail_reads = false;

    // The loop ignores wake-ups, as if its quit message never arrived
    bool drop_wakes = false;

    // Frames arrive already copied to CPU memory, like the PipeWire backend
    bool cpu_frames = false;

    // Behaviour right after the session starts
    bool emit_on_start = true;
    bool close_on_start = false;

    // The loop quits on its own, as if its message pump failed
    bool exit_loop_on_start = false;
};

class FakeFramePool : public FramePool {
public:
    FakeFramePool(SizeI size, const FakeOptions& options, std::shared_ptr<EventLog> log);

    EventToken add_frame_arrived_handler(std::function<void()> handler) override;
    void remove_frame_arrived_handler(EventToken token) override;
    bool try_get_next_frame(ArrivedFrame& frame) override;
    bool recreate(PixelFormat format, int depth, SizeI size) override;
    std::unique_ptr<CaptureSession> create_session(CaptureItem& item) override;
    void close() override;

    // New frame of `content` size on a pool-sized surface, then FrameArrived
    void emit(SizeI content, uint8_t seed);

    // Hook run after the session starts (first frame, early close ...)
    void set_on_session_started(std::function<void()> hook) { m_on_started = std::move(hook); }
    void session_started();

    SizeI size() const { return m_size; }
    int try_get_count() const { return m_try_get_count; }
    const std::vector<SizeI>& recreate_sizes() const { return m_recreate_sizes; }
    size_t handler_count() const { return m_handlers.size(); }

private:
    SizeI m_size;
    const FakeOptions& m_options;
    std::shared_ptr<EventLog> m_log;

    std::map<EventToken, std::function<void()>> m_handlers;
    EventToken m_next_token = 0;

    bool m_has_pending = false;
    ArrivedFrame m_pending;
    int64_t m_next_timestamp = 1000;

    int m_try_get_count = 0;
    std::vector<SizeI> m_recreate_sizes;
    std::function<void()> m_on_started;
};

// Task queue standing in for the capture thread's message queue
struct FakeLoopQueue {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> tasks;
    bool quit = false;
    bool drop_wakes = false;
    int wake_count = 0;
};

// In-process platform: the capture thread runs a task queue, frames are
// CPU buffers with padded rows.
class FakePlatform : public CapturePlatform {
public:
    explicit FakePlatform(FakeOptions options = FakeOptions());
    ~FakePlatform() override;

    const char* get_name() const override { return "Fake"; }

    CaptureStatus resolve_target(const TargetSpec& target,
                                 std::shared_ptr<CaptureItem>& item) override;
    std::vector<TargetInfo> enumerate_targets() override;

    CaptureStatus init_thread() override;
    void uninit_thread() override;

    std::unique_ptr<MessageLoop> create_message_loop() override;

    CaptureStatus create_graphics_device(MessageLoop& loop,
                                         std::shared_ptr<GraphicsDevice>& device) override;

    CaptureStatus create_frame_pool(GraphicsDevice& device, PixelFormat format,
                                    int depth, SizeI size,
                                    std::unique_ptr<FramePool>& pool) override;

    // Test-thread helpers. They run on the capture thread through the loop
    // and return false if the loop did not process them within a second.
    bool deliver_frame(SizeI content, uint8_t seed);
    bool close_target();

    // Let a loop started with drop_wakes exit
    void release_stuck_loop();

    // Wait until uninit_thread() ran
    bool wait_thread_exit(int timeout_ms);

    FakeOptions& options() { return m_options; }
    std::shared_ptr<EventLog> log() const { return m_log; }

    // Only valid while a capture is running
    FakeFramePool* pool() const { return m_pool; }
    std::shared_ptr<FakeItem> last_item() const { return m_last_item; }

    int init_count() const { return m_init_count.load(); }
    int pool_depth() const { return m_pool_depth; }
    PixelFormat pool_format() const { return m_pool_format; }
    int wake_count() const;

private:
    bool post_and_wait(std::function<void()> task);

    FakeOptions m_options;
    std::shared_ptr<EventLog> m_log;

    std::shared_ptr<FakeLoopQueue> m_queue;
    FakeFramePool* m_pool = nullptr;
    std::shared_ptr<FakeItem> m_last_item;

    std::atomic<int> m_init_count{0};
    int m_pool_depth = 0;
    PixelFormat m_pool_format = PixelFormat::RGBA8;

    mutable std::mutex m_exit_mutex;
    std::condition_variable m_exit_cv;
    bool m_thread_exited = false;
};

}  // namespace fake
}  // namespace pixel_forge

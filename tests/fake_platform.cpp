#include "fake_platform.hpp"
#include "capture/surface_converter.hpp"

#include <algorithm>
#include <chrono>
#include <future>

namespace pixel_forge {
namespace fake {

void EventLog::add(const std::string& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(event);
}

std::vector<std::string> EventLog::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

bool EventLog::contains(const std::string& event) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::find(m_entries.begin(), m_entries.end(), event) != m_entries.end();
}

FakeSurface::FakeSurface(SizeI size, uint8_t seed, bool fail_reads)
    : m_size(size)
    , m_pitch(padded_pitch(size.width))
    , m_data(static_cast<size_t>(m_pitch) * size.height, PADDING_BYTE)
    , m_fail_reads(fail_reads) {
    for (int y = 0; y < size.height; y++) {
        uint8_t* row = m_data.data() + static_cast<size_t>(y) * m_pitch;
        for (int x = 0; x < size.width; x++) {
            for (int c = 0; c < 4; c++) {
                row[x * 4 + c] = pattern_byte(seed, x, y, c);
            }
        }
    }
}

bool FakeSurface::read_back(int width, int height, std::vector<uint8_t>& out, int& row_pitch) {
    m_read_count++;
    if (m_fail_reads || width > m_size.width || height > m_size.height) {
        return false;
    }
    out.assign(m_data.begin(), m_data.begin() + static_cast<size_t>(m_pitch) * height);
    row_pitch = m_pitch;
    return true;
}

FakeItem::FakeItem(SizeI size, std::string name, std::shared_ptr<EventLog> log)
    : m_size(size)
    , m_name(std::move(name))
    , m_log(std::move(log)) {
}

EventToken FakeItem::add_closed_handler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    EventToken token = ++m_next_token;
    m_handlers[token] = std::move(handler);
    return token;
}

void FakeItem::remove_closed_handler(EventToken token) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers.erase(token);
    }
    m_log->add("closed_removed");
}

void FakeItem::fire_closed() {
    std::map<EventToken, std::function<void()>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handlers = m_handlers;
    }
    for (auto& entry : handlers) {
        entry.second();
    }
}

size_t FakeItem::handler_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handlers.size();
}

class FakeSession : public CaptureSession {
public:
    FakeSession(FakeFramePool& pool, const FakeOptions& options, std::shared_ptr<EventLog> log)
        : m_pool(pool)
        , m_options(options)
        , m_log(std::move(log)) {}

    bool start() override {
        if (m_options.fail_session_start) {
            return false;
        }
        m_log->add("session_started");
        m_pool.session_started();
        return true;
    }

    void close() override {
        m_log->add("session_closed");
    }

private:
    FakeFramePool& m_pool;
    const FakeOptions& m_options;
    std::shared_ptr<EventLog> m_log;
};

FakeFramePool::FakeFramePool(SizeI size, const FakeOptions& options, std::shared_ptr<EventLog> log)
    : m_size(size)
    , m_options(options)
    , m_log(std::move(log)) {
}

EventToken FakeFramePool::add_frame_arrived_handler(std::function<void()> handler) {
    EventToken token = ++m_next_token;
    m_handlers[token] = std::move(handler);
    return token;
}

void FakeFramePool::remove_frame_arrived_handler(EventToken token) {
    m_handlers.erase(token);
    m_log->add("frame_arrived_removed");
}

bool FakeFramePool::try_get_next_frame(ArrivedFrame& frame) {
    m_try_get_count++;
    if (!m_has_pending) {
        return false;
    }
    frame = std::move(m_pending);
    m_pending = ArrivedFrame();
    m_has_pending = false;
    return true;
}

bool FakeFramePool::recreate(PixelFormat /*format*/, int /*depth*/, SizeI size) {
    m_recreate_sizes.push_back(size);
    m_size = size;
    m_pending = ArrivedFrame();
    m_has_pending = false;
    return true;
}

std::unique_ptr<CaptureSession> FakeFramePool::create_session(CaptureItem& /*item*/) {
    if (m_options.fail_session_creation) {
        return nullptr;
    }
    return std::make_unique<FakeSession>(*this, m_options, m_log);
}

void FakeFramePool::close() {
    m_log->add("pool_closed");
}

void FakeFramePool::emit(SizeI content, uint8_t seed) {
    auto surface = std::make_shared<FakeSurface>(m_size, seed, m_options.fail_reads);
    if (m_options.cpu_frames) {
        auto image = std::make_shared<RawImage>();
        if (surface->read_back(m_size.width, m_size.height, image->data, image->row_pitch)) {
            image->height = m_size.height;
            m_pending.pixels = std::move(image);
        }
    } else {
        m_pending.surface = std::move(surface);
    }
    m_pending.content_size = content;
    m_pending.timestamp_us = m_next_timestamp;
    m_has_pending = true;
    m_next_timestamp += 16667;

    std::map<EventToken, std::function<void()>> handlers = m_handlers;
    for (auto& entry : handlers) {
        entry.second();
    }
}

void FakeFramePool::session_started() {
    if (m_on_started) {
        m_on_started();
    }
}

class FakeLoopWaker : public LoopWaker {
public:
    explicit FakeLoopWaker(std::shared_ptr<FakeLoopQueue> queue) : m_queue(std::move(queue)) {}

    bool wake() override {
        std::lock_guard<std::mutex> lock(m_queue->mutex);
        m_queue->wake_count++;
        if (!m_queue->drop_wakes) {
            m_queue->quit = true;
            m_queue->cv.notify_all();
        }
        return true;
    }

private:
    std::shared_ptr<FakeLoopQueue> m_queue;
};

class FakeMessageLoop : public MessageLoop {
public:
    FakeMessageLoop(std::shared_ptr<FakeLoopQueue> queue, std::shared_ptr<EventLog> log)
        : m_queue(std::move(queue))
        , m_log(std::move(log)) {}

    ~FakeMessageLoop() override {
        m_log->add("loop_released");
    }

    void run(const std::function<bool()>& keep_running) override {
        while (keep_running()) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(m_queue->mutex);
                m_queue->cv.wait(lock, [this]() {
                    return m_queue->quit || !m_queue->tasks.empty();
                });
                if (m_queue->quit) {
                    break;
                }
                task = std::move(m_queue->tasks.front());
                m_queue->tasks.pop_front();
            }
            task();
        }
    }

    std::shared_ptr<LoopWaker> waker() const override {
        return std::make_shared<FakeLoopWaker>(m_queue);
    }

private:
    std::shared_ptr<FakeLoopQueue> m_queue;
    std::shared_ptr<EventLog> m_log;
};

class FakeDevice : public GraphicsDevice {
public:
    explicit FakeDevice(std::shared_ptr<EventLog> log) : m_log(std::move(log)) {}
    ~FakeDevice() override { m_log->add("device_released"); }

private:
    std::shared_ptr<EventLog> m_log;
};

FakePlatform::FakePlatform(FakeOptions options)
    : m_options(std::move(options))
    , m_log(std::make_shared<EventLog>()) {
}

FakePlatform::~FakePlatform() = default;

CaptureStatus FakePlatform::resolve_target(const TargetSpec& target,
                                           std::shared_ptr<CaptureItem>& item) {
    std::string name;
    switch (target.kind) {
        case TargetKind::PRIMARY_MONITOR:
            name = "FAKE1";
            break;
        case TargetKind::MONITOR_INDEX:
            if (target.monitor_index < 1 || target.monitor_index > m_options.monitor_count) {
                return CaptureStatus::TARGET_NOT_FOUND;
            }
            name = "FAKE" + std::to_string(target.monitor_index);
            break;
        case TargetKind::WINDOW_TITLE:
            if (target.window_title != m_options.window_title) {
                return CaptureStatus::TARGET_NOT_FOUND;
            }
            name = target.window_title;
            break;
        default:
            return CaptureStatus::TARGET_INVALID;
    }

    m_last_item = std::make_shared<FakeItem>(m_options.target_size, name, m_log);
    item = m_last_item;
    return CaptureStatus::OK;
}

std::vector<TargetInfo> FakePlatform::enumerate_targets() {
    std::vector<TargetInfo> targets;
    for (int i = 1; i <= m_options.monitor_count; i++) {
        TargetInfo info;
        info.kind = TargetKind::MONITOR_INDEX;
        info.index = i;
        info.name = "FAKE" + std::to_string(i);
        info.size = m_options.target_size;
        info.refresh_rate = 60;
        targets.push_back(info);
    }

    TargetInfo window;
    window.kind = TargetKind::WINDOW_HANDLE;
    window.handle = 0x1234;
    window.name = m_options.window_title;
    window.size = m_options.target_size;
    targets.push_back(window);
    return targets;
}

CaptureStatus FakePlatform::init_thread() {
    m_init_count++;
    {
        std::lock_guard<std::mutex> lock(m_exit_mutex);
        m_thread_exited = false;
    }
    m_log->add("init_thread");
    return m_options.init_status;
}

void FakePlatform::uninit_thread() {
    m_log->add("uninit_thread");
    std::lock_guard<std::mutex> lock(m_exit_mutex);
    m_thread_exited = true;
    m_exit_cv.notify_all();
}

std::unique_ptr<MessageLoop> FakePlatform::create_message_loop() {
    if (m_options.fail_loop) {
        return nullptr;
    }
    auto queue = std::make_shared<FakeLoopQueue>();
    queue->drop_wakes = m_options.drop_wakes;
    {
        std::lock_guard<std::mutex> lock(m_exit_mutex);
        m_queue = queue;
    }
    return std::make_unique<FakeMessageLoop>(queue, m_log);
}

CaptureStatus FakePlatform::create_graphics_device(MessageLoop& /*loop*/,
                                                   std::shared_ptr<GraphicsDevice>& device) {
    if (!succeeded(m_options.device_status)) {
        return m_options.device_status;
    }
    device = std::make_shared<FakeDevice>(m_log);
    return CaptureStatus::OK;
}

CaptureStatus FakePlatform::create_frame_pool(GraphicsDevice& /*device*/, PixelFormat format,
                                              int depth, SizeI size,
                                              std::unique_ptr<FramePool>& pool) {
    auto fake_pool = std::make_unique<FakeFramePool>(size, m_options, m_log);
    FakeFramePool* raw = fake_pool.get();

    std::shared_ptr<FakeLoopQueue> queue;
    {
        std::lock_guard<std::mutex> lock(m_exit_mutex);
        queue = m_queue;
    }

    // Like the real platforms, the first events arrive through the loop
    raw->set_on_session_started([this, raw, queue]() {
        if (!queue) {
            return;
        }
        std::lock_guard<std::mutex> lock(queue->mutex);
        if (m_options.emit_on_start) {
            queue->tasks.push_back([raw]() { raw->emit(raw->size(), 1); });
        }
        if (m_options.close_on_start) {
            queue->tasks.push_back([this]() {
                if (m_last_item) {
                    m_last_item->fire_closed();
                }
            });
        }
        if (m_options.exit_loop_on_start) {
            FakeLoopQueue* loop_queue = queue.get();
            queue->tasks.push_back([loop_queue]() {
                std::lock_guard<std::mutex> quit_lock(loop_queue->mutex);
                loop_queue->quit = true;
            });
        }
        queue->cv.notify_all();
    });

    m_pool = raw;
    m_pool_depth = depth;
    m_pool_format = format;
    m_log->add("pool_created");
    pool = std::move(fake_pool);
    return CaptureStatus::OK;
}

bool FakePlatform::post_and_wait(std::function<void()> task) {
    std::shared_ptr<FakeLoopQueue> queue;
    {
        std::lock_guard<std::mutex> lock(m_exit_mutex);
        queue = m_queue;
    }
    if (!queue) {
        return false;
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    {
        std::lock_guard<std::mutex> lock(queue->mutex);
        queue->tasks.push_back([task, done]() {
            task();
            done->set_value();
        });
        queue->cv.notify_all();
    }
    return finished.wait_for(std::chrono::seconds(1)) == std::future_status::ready;
}

bool FakePlatform::deliver_frame(SizeI content, uint8_t seed) {
    return post_and_wait([this, content, seed]() {
        if (m_pool) {
            m_pool->emit(content, seed);
        }
    });
}

bool FakePlatform::close_target() {
    return post_and_wait([this]() {
        if (m_last_item) {
            m_last_item->fire_closed();
        }
    });
}

void FakePlatform::release_stuck_loop() {
    std::shared_ptr<FakeLoopQueue> queue;
    {
        std::lock_guard<std::mutex> lock(m_exit_mutex);
        queue = m_queue;
    }
    if (!queue) {
        return;
    }
    std::lock_guard<std::mutex> lock(queue->mutex);
    queue->quit = true;
    queue->cv.notify_all();
}

bool FakePlatform::wait_thread_exit(int timeout_ms) {
    std::unique_lock<std::mutex> lock(m_exit_mutex);
    return m_exit_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                              [this]() { return m_thread_exited; });
}

int FakePlatform::wake_count() const {
    std::shared_ptr<FakeLoopQueue> queue;
    {
        std::lock_guard<std::mutex> lock(m_exit_mutex);
        queue = m_queue;
    }
    if (!queue) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(queue->mutex);
    return queue->wake_count;
}

}  // namespace fake
}  // namespace pixel_forge

#include "pipewire_platform.hpp"
#include "screencast_portal.hpp"
#include "../../capture/surface_converter.hpp"
#include "../../util/logger.hpp"

#include <pipewire/pipewire.h>
#include <spa/buffer/meta.h>
#include <spa/debug/types.h>
#include <spa/param/video/format-utils.h>
#include <spa/param/video/type-info.h>
#include <spa/utils/result.h>

#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <map>
#include <mutex>

namespace pixel_forge {

// Used when the portal does not report the stream size; renegotiated on the first frame
static const SizeI DEFAULT_STREAM_SIZE = {1920, 1080};

// Capture item backed by a portal session. Owns the session and the
// PipeWire remote fd until destroyed.
class PipeWireItem : public CaptureItem {
public:
    PipeWireItem(std::unique_ptr<ScreenCastPortal> portal, int fd, SizeI size, std::string name)
        : m_portal(std::move(portal))
        , m_fd(fd)
        , m_size(size)
        , m_name(std::move(name)) {}

    ~PipeWireItem() override {
        if (m_fd >= 0) {
            close(m_fd);
        }
        m_portal->close();
    }

    SizeI size() const override { return m_size; }
    std::string display_name() const override { return m_name; }

    EventToken add_closed_handler(std::function<void()> handler) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        EventToken token = ++m_next_token;
        m_closed_handlers[token] = std::move(handler);
        return token;
    }

    void remove_closed_handler(EventToken token) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed_handlers.erase(token);
    }

    // Stream went away (window closed, screencast revoked)
    void notify_closed() {
        std::map<EventToken, std::function<void()>> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            handlers = m_closed_handlers;
        }
        for (auto& entry : handlers) {
            entry.second();
        }
    }

    uint32_t get_node_id() const { return m_portal->get_node_id(); }

    // pw_context_connect_fd takes ownership, so every connection gets a dup
    int dup_fd() const { return m_fd >= 0 ? dup(m_fd) : -1; }

private:
    std::unique_ptr<ScreenCastPortal> m_portal;
    int m_fd;
    SizeI m_size;
    std::string m_name;

    std::mutex m_mutex;
    std::map<EventToken, std::function<void()>> m_closed_handlers;
    EventToken m_next_token = 0;
};

// Swizzle the first `width` pixels of a row into the requested order
static void convert_row(uint8_t* row, int width, uint32_t spa_format, PixelFormat target_format) {
    const bool want_rgba = target_format == PixelFormat::RGBA8;

    switch (spa_format) {
        case SPA_VIDEO_FORMAT_RGBA:
        case SPA_VIDEO_FORMAT_RGBx:
        case SPA_VIDEO_FORMAT_BGRA:
        case SPA_VIDEO_FORMAT_BGRx: {
            const bool is_rgba = spa_format == SPA_VIDEO_FORMAT_RGBA ||
                                 spa_format == SPA_VIDEO_FORMAT_RGBx;
            if (is_rgba != want_rgba) {
                swap_red_blue(row, static_cast<size_t>(width));
            }
            // Padding byte -> opaque alpha
            if (spa_format == SPA_VIDEO_FORMAT_RGBx || spa_format == SPA_VIDEO_FORMAT_BGRx) {
                for (int x = 0; x < width; x++) {
                    row[x * 4 + 3] = 255;
                }
            }
            break;
        }

        case SPA_VIDEO_FORMAT_xBGR:
        case SPA_VIDEO_FORMAT_xRGB:
            // Leading padding byte: shift the color bytes down
            for (int x = 0; x < width; x++) {
                uint8_t* p = row + x * 4;
                uint8_t c1 = p[1];
                uint8_t c2 = p[2];
                uint8_t c3 = p[3];
                const bool is_rgb = spa_format == SPA_VIDEO_FORMAT_xRGB;
                if (is_rgb == want_rgba) {
                    p[0] = c1; p[1] = c2; p[2] = c3;
                } else {
                    p[0] = c3; p[1] = c2; p[2] = c1;
                }
                p[3] = 255;
            }
            break;

        default:
            // Not offered in the format params, left as delivered
            break;
    }
}

// pw_loop owned by the capture thread. The wake event is the only thing other
// threads touch; the waker keeps the guard alive after the loop is gone.
class PipeWireLoop : public MessageLoop {
public:
    struct WakeTarget {
        std::mutex mutex;
        struct pw_loop* loop = nullptr;
        struct spa_source* event = nullptr;
    };

    class Waker : public LoopWaker {
    public:
        explicit Waker(std::shared_ptr<WakeTarget> target) : m_target(std::move(target)) {}

        bool wake() override {
            std::lock_guard<std::mutex> lock(m_target->mutex);
            if (!m_target->loop) {
                return false;
            }
            return pw_loop_signal_event(m_target->loop, m_target->event) >= 0;
        }

    private:
        std::shared_ptr<WakeTarget> m_target;
    };

    PipeWireLoop() : m_target(std::make_shared<WakeTarget>()) {}

    ~PipeWireLoop() override {
        {
            std::lock_guard<std::mutex> lock(m_target->mutex);
            m_target->loop = nullptr;
            m_target->event = nullptr;
        }
        if (m_wake_event) {
            pw_loop_destroy_source(m_loop, m_wake_event);
        }
        if (m_loop) {
            pw_loop_destroy(m_loop);
        }
    }

    bool init() {
        m_loop = pw_loop_new(nullptr);
        if (!m_loop) {
            LOG_ERROR("Failed to create PipeWire loop");
            return false;
        }

        m_wake_event = pw_loop_add_event(m_loop, on_wake_cb, this);
        if (!m_wake_event) {
            LOG_ERROR("Failed to add PipeWire wake event");
            return false;
        }

        std::lock_guard<std::mutex> lock(m_target->mutex);
        m_target->loop = m_loop;
        m_target->event = m_wake_event;
        return true;
    }

    void run(const std::function<bool()>& keep_running) override {
        pw_loop_enter(m_loop);
        while (!m_quit && keep_running()) {
            int ret = pw_loop_iterate(m_loop, -1);
            if (ret < 0 && ret != -EINTR) {
                LOG_ERROR("PipeWire loop iteration failed: %s", spa_strerror(ret));
                break;
            }
        }
        pw_loop_leave(m_loop);
    }

    std::shared_ptr<LoopWaker> waker() const override {
        return std::make_shared<Waker>(m_target);
    }

    struct pw_loop* get_loop() const { return m_loop; }

private:
    static void on_wake_cb(void* data, uint64_t /*count*/) {
        static_cast<PipeWireLoop*>(data)->m_quit = true;
    }

    struct pw_loop* m_loop = nullptr;
    struct spa_source* m_wake_event = nullptr;
    std::shared_ptr<WakeTarget> m_target;
    bool m_quit = false;
};

class PipeWireDevice : public GraphicsDevice {
public:
    explicit PipeWireDevice(struct pw_context* context) : m_context(context) {}

    ~PipeWireDevice() override {
        if (m_context) {
            pw_context_destroy(m_context);
        }
    }

    struct pw_context* get_context() const { return m_context; }

private:
    struct pw_context* m_context;
};

class PipeWireFramePool;

class PipeWireSession : public CaptureSession {
public:
    PipeWireSession(PipeWireFramePool& pool, uint32_t node_id)
        : m_pool(pool)
        , m_node_id(node_id) {}

    bool start() override;
    void close() override;

private:
    PipeWireFramePool& m_pool;
    uint32_t m_node_id;
};

// The stream's negotiated buffers stand in for the frame pool
class PipeWireFramePool : public FramePool {
public:
    PipeWireFramePool(struct pw_context* context, PixelFormat format, SizeI size)
        : m_context(context)
        , m_target_format(format)
        , m_requested_size(size) {}

    ~PipeWireFramePool() override {
        close();
    }

    EventToken add_frame_arrived_handler(std::function<void()> handler) override {
        EventToken token = ++m_next_token;
        m_frame_handlers[token] = std::move(handler);
        return token;
    }

    void remove_frame_arrived_handler(EventToken token) override {
        m_frame_handlers.erase(token);
    }

    bool try_get_next_frame(ArrivedFrame& frame) override {
        if (!m_pending.pixels) {
            return false;
        }
        frame = std::move(m_pending);
        m_pending = ArrivedFrame();
        return true;
    }

    bool recreate(PixelFormat format, int /*depth*/, SizeI size) override {
        m_target_format = format;
        m_requested_size = size;
        m_pending = ArrivedFrame();

        if (!m_stream) {
            return false;
        }

        uint8_t buffer[1024];
        struct spa_pod_builder b = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
        const struct spa_pod* params[1];
        params[0] = build_format_param(&b);

        int ret = pw_stream_update_params(m_stream, params, 1);
        if (ret < 0) {
            LOG_ERROR("Failed to update stream params: %s", spa_strerror(ret));
            return false;
        }
        return true;
    }

    std::unique_ptr<CaptureSession> create_session(CaptureItem& item) override {
        auto* pw_item = dynamic_cast<PipeWireItem*>(&item);
        if (!pw_item) {
            LOG_ERROR("Capture item was not created by the PipeWire platform");
            return nullptr;
        }

        int fd = pw_item->dup_fd();
        if (fd < 0) {
            LOG_ERROR("No PipeWire remote for '%s'", pw_item->display_name().c_str());
            return nullptr;
        }

        m_core = pw_context_connect_fd(m_context, fd, nullptr, 0);
        if (!m_core) {
            LOG_ERROR("Failed to connect to PipeWire");
            return nullptr;
        }

        struct pw_properties* props = pw_properties_new(
            PW_KEY_MEDIA_TYPE, "Video",
            PW_KEY_MEDIA_CATEGORY, "Capture",
            PW_KEY_MEDIA_ROLE, "Screen",
            nullptr
        );

        m_stream = pw_stream_new(m_core, "pixel-forge-capture", props);
        if (!m_stream) {
            LOG_ERROR("Failed to create PipeWire stream");
            return nullptr;
        }

        pw_stream_add_listener(m_stream, &m_stream_listener, &stream_events(), this);
        m_item = pw_item;
        return std::make_unique<PipeWireSession>(*this, pw_item->get_node_id());
    }

    void close() override {
        disconnect();
        if (m_stream) {
            pw_stream_destroy(m_stream);
            m_stream = nullptr;
        }
        if (m_core) {
            pw_core_disconnect(m_core);
            m_core = nullptr;
        }
        m_pending = ArrivedFrame();
        m_item = nullptr;
    }

    bool connect(uint32_t node_id) {
        uint8_t buffer[1024];
        struct spa_pod_builder b = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
        const struct spa_pod* params[1];
        params[0] = build_format_param(&b);

        int ret = pw_stream_connect(
            m_stream,
            PW_DIRECTION_INPUT,
            node_id,
            static_cast<enum pw_stream_flags>(
                PW_STREAM_FLAG_AUTOCONNECT |
                PW_STREAM_FLAG_MAP_BUFFERS
            ),
            params, 1
        );

        if (ret < 0) {
            LOG_ERROR("Failed to connect stream: %s", spa_strerror(ret));
            return false;
        }

        LOG_INFO("Connected to PipeWire stream, node %u", node_id);
        return true;
    }

    void disconnect() {
        if (m_stream && m_connected) {
            // Our own disconnect is not a target close
            m_connected = false;
            pw_stream_disconnect(m_stream);
        }
    }

private:
    static const struct pw_stream_events& stream_events() {
        static const struct pw_stream_events events = make_stream_events();
        return events;
    }

    static struct pw_stream_events make_stream_events() {
        struct pw_stream_events events;
        memset(&events, 0, sizeof(events));
        events.version = PW_VERSION_STREAM_EVENTS;
        events.state_changed = on_state_changed_cb;
        events.param_changed = on_param_changed_cb;
        events.process = on_process_cb;
        return events;
    }

    static void on_state_changed_cb(void* data, enum pw_stream_state old_state,
                                    enum pw_stream_state state, const char* error) {
        static_cast<PipeWireFramePool*>(data)->on_state_changed(old_state, state, error);
    }

    static void on_param_changed_cb(void* data, uint32_t id, const struct spa_pod* param) {
        static_cast<PipeWireFramePool*>(data)->on_param_changed(id, param);
    }

    static void on_process_cb(void* data) {
        static_cast<PipeWireFramePool*>(data)->on_process();
    }

    const struct spa_pod* build_format_param(struct spa_pod_builder* b) const {
        uint32_t preferred = m_target_format == PixelFormat::RGBA8 ? SPA_VIDEO_FORMAT_RGBA
                                                                   : SPA_VIDEO_FORMAT_BGRA;
        struct spa_rectangle default_size = {static_cast<uint32_t>(m_requested_size.width),
                                             static_cast<uint32_t>(m_requested_size.height)};
        struct spa_rectangle min_size = {1, 1};
        struct spa_rectangle max_size = {8192, 8192};
        struct spa_fraction default_rate = {60, 1};
        struct spa_fraction min_rate = {0, 1};
        struct spa_fraction max_rate = {144, 1};

        return static_cast<const struct spa_pod*>(spa_pod_builder_add_object(b,
            SPA_TYPE_OBJECT_Format, SPA_PARAM_EnumFormat,
            SPA_FORMAT_mediaType,       SPA_POD_Id(SPA_MEDIA_TYPE_video),
            SPA_FORMAT_mediaSubtype,    SPA_POD_Id(SPA_MEDIA_SUBTYPE_raw),
            SPA_FORMAT_VIDEO_format,    SPA_POD_CHOICE_ENUM_Id(7,
                preferred,
                SPA_VIDEO_FORMAT_RGBA,
                SPA_VIDEO_FORMAT_RGBx,
                SPA_VIDEO_FORMAT_BGRA,
                SPA_VIDEO_FORMAT_BGRx,
                SPA_VIDEO_FORMAT_xBGR,
                SPA_VIDEO_FORMAT_xRGB),
            SPA_FORMAT_VIDEO_size,      SPA_POD_CHOICE_RANGE_Rectangle(
                &default_size, &min_size, &max_size),
            SPA_FORMAT_VIDEO_framerate, SPA_POD_CHOICE_RANGE_Fraction(
                &default_rate, &min_rate, &max_rate)));
    }

    void on_state_changed(enum pw_stream_state old_state, enum pw_stream_state state,
                          const char* error) {
        LOG_INFO("PipeWire stream state: %s -> %s",
                 pw_stream_state_as_string(old_state),
                 pw_stream_state_as_string(state));

        if (error) {
            LOG_ERROR("Stream error: %s", error);
        }

        if (state == PW_STREAM_STATE_PAUSED || state == PW_STREAM_STATE_STREAMING) {
            m_connected = true;
        } else if (state == PW_STREAM_STATE_ERROR ||
                   (state == PW_STREAM_STATE_UNCONNECTED && m_connected)) {
            m_connected = false;
            if (m_item) {
                m_item->notify_closed();
            }
        }
    }

    void on_param_changed(uint32_t id, const struct spa_pod* param) {
        if (!param || id != SPA_PARAM_Format) {
            return;
        }

        struct spa_video_info_raw info;
        if (spa_format_video_raw_parse(param, &info) < 0) {
            LOG_ERROR("Failed to parse video format");
            return;
        }

        m_width = static_cast<int>(info.size.width);
        m_height = static_cast<int>(info.size.height);
        m_format = info.format;

        LOG_INFO("Stream format: %dx%d, format=%u (%s)",
                 m_width, m_height, m_format,
                 spa_debug_type_find_name(spa_type_video_format, m_format));

        // Mappable memory plus the crop region of the content inside the buffer
        uint8_t buffer[1024];
        struct spa_pod_builder b = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
        const struct spa_pod* params[2];
        params[0] = static_cast<const struct spa_pod*>(spa_pod_builder_add_object(&b,
            SPA_TYPE_OBJECT_ParamBuffers, SPA_PARAM_Buffers,
            SPA_PARAM_BUFFERS_dataType, SPA_POD_CHOICE_FLAGS_Int(
                (1 << SPA_DATA_MemPtr) | (1 << SPA_DATA_MemFd))));
        params[1] = static_cast<const struct spa_pod*>(spa_pod_builder_add_object(&b,
            SPA_TYPE_OBJECT_ParamMeta, SPA_PARAM_Meta,
            SPA_PARAM_META_type, SPA_POD_Id(SPA_META_VideoCrop),
            SPA_PARAM_META_size, SPA_POD_Int(sizeof(struct spa_meta_region))));
        pw_stream_update_params(m_stream, params, 2);
    }

    void on_process() {
        struct pw_buffer* b = pw_stream_dequeue_buffer(m_stream);
        if (!b) {
            return;
        }

        struct spa_buffer* buf = b->buffer;
        struct spa_data* d = &buf->datas[0];

        if (!d->data || m_width <= 0 || m_height <= 0) {
            pw_stream_queue_buffer(m_stream, b);
            return;
        }

        auto now = std::chrono::steady_clock::now();
        int64_t timestamp = std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()).count();

        const uint8_t* src = static_cast<const uint8_t*>(d->data) + d->chunk->offset;
        int stride = d->chunk->stride > 0 ? d->chunk->stride : m_width * BYTES_PER_PIXEL;
        size_t available = d->chunk->size ? d->chunk->size : d->maxsize - d->chunk->offset;
        int rows = std::min(m_height, static_cast<int>(available / stride));
        if (rows <= 0) {
            pw_stream_queue_buffer(m_stream, b);
            return;
        }

        // The content may only fill part of the buffer
        SizeI content{m_width, m_height};
        int crop_x = 0;
        int crop_y = 0;
        auto* crop = static_cast<struct spa_meta_region*>(
            spa_buffer_find_meta_data(buf, SPA_META_VideoCrop, sizeof(struct spa_meta_region)));
        if (crop && spa_meta_region_is_valid(crop)) {
            int x = crop->region.position.x;
            int y = crop->region.position.y;
            int w = static_cast<int>(crop->region.size.width);
            int h = static_cast<int>(crop->region.size.height);
            if (x >= 0 && y >= 0 && (x + w) * BYTES_PER_PIXEL <= stride && y + h <= rows) {
                crop_x = x;
                crop_y = y;
                content = SizeI{w, h};
            }
        }
        content.width = std::min(content.width, (stride - crop_x * BYTES_PER_PIXEL) / BYTES_PER_PIXEL);
        content.height = std::min(content.height, rows - crop_y);

        // Snapshot now: the buffer goes back to the compositor below
        auto image = std::make_shared<RawImage>();
        image->row_pitch = stride - crop_x * BYTES_PER_PIXEL;
        image->height = rows - crop_y;
        image->data.resize(static_cast<size_t>(image->row_pitch) * image->height);
        const uint8_t* origin = src + static_cast<size_t>(crop_y) * stride + crop_x * BYTES_PER_PIXEL;
        if (crop_x == 0) {
            memcpy(image->data.data(), origin, image->data.size());
        } else {
            for (int y = 0; y < image->height; y++) {
                memcpy(image->data.data() + static_cast<size_t>(y) * image->row_pitch,
                       origin + static_cast<size_t>(y) * stride, image->row_pitch);
            }
        }

        pw_stream_queue_buffer(m_stream, b);

        for (int y = 0; y < image->height; y++) {
            convert_row(image->data.data() + static_cast<size_t>(y) * image->row_pitch,
                        content.width, m_format, m_target_format);
        }

        m_pending.pixels = std::move(image);
        m_pending.content_size = content;
        m_pending.timestamp_us = timestamp;

        for (auto& entry : m_frame_handlers) {
            entry.second();
        }
    }

    struct pw_context* m_context;
    struct pw_core* m_core = nullptr;
    struct pw_stream* m_stream = nullptr;
    struct spa_hook m_stream_listener = {};
    PipeWireItem* m_item = nullptr;
    bool m_connected = false;

    PixelFormat m_target_format;
    SizeI m_requested_size;

    // Negotiated format
    int m_width = 0;
    int m_height = 0;
    uint32_t m_format = 0;

    ArrivedFrame m_pending;
    std::map<EventToken, std::function<void()>> m_frame_handlers;
    EventToken m_next_token = 0;
};

bool PipeWireSession::start() {
    return m_pool.connect(m_node_id);
}

void PipeWireSession::close() {
    m_pool.disconnect();
}

CaptureStatus PipeWirePlatform::resolve_target(const TargetSpec& target,
                                               std::shared_ptr<CaptureItem>& item) {
    PortalSourceType type = PortalSourceType::MONITOR;
    switch (target.kind) {
        case TargetKind::PRIMARY_MONITOR:
        case TargetKind::PORTAL_MONITOR:
            type = PortalSourceType::MONITOR;
            break;
        case TargetKind::PORTAL_WINDOW:
            type = PortalSourceType::WINDOW;
            break;
        case TargetKind::MONITOR_INDEX:
        case TargetKind::MONITOR_HANDLE:
        case TargetKind::WINDOW_TITLE:
        case TargetKind::WINDOW_HANDLE:
        case TargetKind::FOREGROUND_WINDOW:
            LOG_ERROR("PipeWire capture targets are chosen in the portal dialog; "
                      "use the primary monitor or a portal target");
            return CaptureStatus::TARGET_INVALID;
    }

    auto portal = std::make_unique<ScreenCastPortal>();
    CaptureStatus status = portal->open(type);
    if (!succeeded(status)) {
        return status;
    }

    int fd = portal->open_pipewire_remote();
    if (fd < 0) {
        portal->close();
        return CaptureStatus::PLATFORM_INIT_FAILED;
    }

    SizeI size = portal->get_stream_size();
    if (size.width <= 0 || size.height <= 0) {
        LOG_WARN("Portal did not report the stream size, assuming %dx%d",
                 DEFAULT_STREAM_SIZE.width, DEFAULT_STREAM_SIZE.height);
        size = DEFAULT_STREAM_SIZE;
    }

    std::string name = std::string(type == PortalSourceType::MONITOR ? "monitor" : "window") +
                       " (node " + std::to_string(portal->get_node_id()) + ")";
    item = std::make_shared<PipeWireItem>(std::move(portal), fd, size, std::move(name));
    return CaptureStatus::OK;
}

CaptureStatus PipeWirePlatform::init_thread() {
    pw_init(nullptr, nullptr);
    return CaptureStatus::OK;
}

void PipeWirePlatform::uninit_thread() {
    pw_deinit();
}

std::unique_ptr<MessageLoop> PipeWirePlatform::create_message_loop() {
    auto loop = std::make_unique<PipeWireLoop>();
    if (!loop->init()) {
        return nullptr;
    }
    return loop;
}

CaptureStatus PipeWirePlatform::create_graphics_device(MessageLoop& loop,
                                                       std::shared_ptr<GraphicsDevice>& device) {
    auto* pw_loop = dynamic_cast<PipeWireLoop*>(&loop);
    if (!pw_loop) {
        LOG_ERROR("Message loop was not created by the PipeWire platform");
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    struct pw_context* context = pw_context_new(pw_loop->get_loop(), nullptr, 0);
    if (!context) {
        LOG_ERROR("Failed to create PipeWire context");
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    device = std::make_shared<PipeWireDevice>(context);
    return CaptureStatus::OK;
}

CaptureStatus PipeWirePlatform::create_frame_pool(GraphicsDevice& device, PixelFormat format,
                                                  int /*depth*/, SizeI size,
                                                  std::unique_ptr<FramePool>& pool) {
    auto* pw_device = dynamic_cast<PipeWireDevice*>(&device);
    if (!pw_device) {
        LOG_ERROR("Graphics device was not created by the PipeWire platform");
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    pool = std::make_unique<PipeWireFramePool>(pw_device->get_context(), format, size);
    return CaptureStatus::OK;
}

}  // namespace pixel_forge

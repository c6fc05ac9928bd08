#include "../../util/logger.hpp"
#include "wgc_platform.hpp"
#include "d3d_device.hpp"
#include "wgc_target.hpp"

#include <DispatcherQueue.h>
#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Graphics.Capture.h>
#include <winrt/Windows.Graphics.DirectX.h>
#include <winrt/Windows.System.h>

#include <chrono>
#include <cstring>

namespace pixel_forge {

using winrt::Windows::Graphics::Capture::Direct3D11CaptureFrame;
using winrt::Windows::Graphics::Capture::Direct3D11CaptureFramePool;
using winrt::Windows::Graphics::Capture::GraphicsCaptureItem;
using winrt::Windows::Graphics::Capture::GraphicsCaptureSession;
using winrt::Windows::Graphics::DirectX::DirectXPixelFormat;
using winrt::Windows::System::DispatcherQueueController;

static DirectXPixelFormat to_directx_format(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGBA8: return DirectXPixelFormat::R8G8B8A8UIntNormalized;
        case PixelFormat::BGRA8: return DirectXPixelFormat::B8G8R8A8UIntNormalized;
    }
    return DirectXPixelFormat::R8G8B8A8UIntNormalized;
}

static void log_hresult(const char* what, const winrt::hresult_error& e) {
    LOG_ERROR("%s failed: 0x%08X %ls", what, static_cast<unsigned>(e.code().value),
              e.message().c_str());
}

// Private copy of one arrived frame, read back through a staging texture
class WgcSurface : public GpuSurface {
public:
    WgcSurface(winrt::com_ptr<ID3D11Device> device,
               winrt::com_ptr<ID3D11DeviceContext> context,
               winrt::com_ptr<ID3D11Texture2D> texture)
        : m_device(std::move(device))
        , m_context(std::move(context))
        , m_texture(std::move(texture)) {
        m_texture->GetDesc(&m_desc);
    }

    bool read_back(int width, int height, std::vector<uint8_t>& out, int& row_pitch) override {
        if (width <= 0 || height <= 0 ||
            static_cast<UINT>(width) > m_desc.Width || static_cast<UINT>(height) > m_desc.Height) {
            LOG_ERROR("Readback of %dx%d outside %ux%u texture",
                      width, height, m_desc.Width, m_desc.Height);
            return false;
        }

        D3D11_TEXTURE2D_DESC staging_desc = m_desc;
        staging_desc.Usage = D3D11_USAGE_STAGING;
        staging_desc.BindFlags = 0;
        staging_desc.CPUAccessFlags = D3D11_CPU_ACCESS_READ;
        staging_desc.MiscFlags = 0;

        winrt::com_ptr<ID3D11Texture2D> staging;
        HRESULT hr = m_device->CreateTexture2D(&staging_desc, nullptr, staging.put());
        if (FAILED(hr)) {
            LOG_ERROR("Failed to create staging texture: 0x%08lX", static_cast<unsigned long>(hr));
            return false;
        }

        m_context->CopyResource(staging.get(), m_texture.get());

        D3D11_MAPPED_SUBRESOURCE mapped = {};
        hr = m_context->Map(staging.get(), 0, D3D11_MAP_READ, 0, &mapped);
        if (FAILED(hr)) {
            LOG_ERROR("Failed to map staging texture: 0x%08lX", static_cast<unsigned long>(hr));
            return false;
        }

        row_pitch = static_cast<int>(mapped.RowPitch);
        out.resize(static_cast<size_t>(mapped.RowPitch) * height);
        memcpy(out.data(), mapped.pData, out.size());

        m_context->Unmap(staging.get(), 0);
        return true;
    }

    SizeI allocated_size() const override {
        return SizeI{static_cast<int>(m_desc.Width), static_cast<int>(m_desc.Height)};
    }

private:
    winrt::com_ptr<ID3D11Device> m_device;
    winrt::com_ptr<ID3D11DeviceContext> m_context;
    winrt::com_ptr<ID3D11Texture2D> m_texture;
    D3D11_TEXTURE2D_DESC m_desc = {};
};

class WgcSession : public CaptureSession {
public:
    explicit WgcSession(GraphicsCaptureSession session) : m_session(std::move(session)) {}

    bool start() override {
        try {
            m_session.StartCapture();
        } catch (const winrt::hresult_error& e) {
            log_hresult("StartCapture", e);
            return false;
        }
        return true;
    }

    void close() override {
        try {
            m_session.Close();
        } catch (const winrt::hresult_error& e) {
            log_hresult("GraphicsCaptureSession::Close", e);
        }
        m_session = nullptr;
    }

private:
    GraphicsCaptureSession m_session{nullptr};
};

class WgcFramePool : public FramePool {
public:
    WgcFramePool(const WgcDevice& device, Direct3D11CaptureFramePool pool)
        : m_capture_device(device.get_capture_device())
        , m_pool(std::move(pool)) {
        m_device.copy_from(device.get_device());
        m_context.copy_from(device.get_context());
    }

    EventToken add_frame_arrived_handler(std::function<void()> handler) override {
        winrt::event_token token = m_pool.FrameArrived(
            [handler = std::move(handler)](const Direct3D11CaptureFramePool&,
                                           const winrt::Windows::Foundation::IInspectable&) {
                handler();
            });
        return token.value;
    }

    void remove_frame_arrived_handler(EventToken token) override {
        m_pool.FrameArrived(winrt::event_token{token});
    }

    bool try_get_next_frame(ArrivedFrame& arrived) override {
        try {
            Direct3D11CaptureFrame frame = m_pool.TryGetNextFrame();
            if (!frame) {
                return false;
            }

            auto content = frame.ContentSize();
            auto timestamp = frame.SystemRelativeTime();

            // Pool surfaces are reused once the frame is closed; keep our own copy
            winrt::com_ptr<ID3D11Texture2D> source = get_surface_texture(frame.Surface());
            D3D11_TEXTURE2D_DESC desc;
            source->GetDesc(&desc);
            desc.Usage = D3D11_USAGE_DEFAULT;
            desc.BindFlags = 0;
            desc.CPUAccessFlags = 0;
            desc.MiscFlags = 0;

            winrt::com_ptr<ID3D11Texture2D> copy;
            HRESULT hr = m_device->CreateTexture2D(&desc, nullptr, copy.put());
            if (FAILED(hr)) {
                LOG_ERROR("Failed to create frame texture: 0x%08lX", static_cast<unsigned long>(hr));
                frame.Close();
                return false;
            }
            m_context->CopyResource(copy.get(), source.get());
            frame.Close();

            arrived.surface = std::make_shared<WgcSurface>(m_device, m_context, std::move(copy));
            arrived.content_size = SizeI{content.Width, content.Height};
            arrived.timestamp_us =
                std::chrono::duration_cast<std::chrono::microseconds>(timestamp).count();
        } catch (const winrt::hresult_error& e) {
            log_hresult("TryGetNextFrame", e);
            return false;
        }
        return true;
    }

    bool recreate(PixelFormat format, int depth, SizeI size) override {
        try {
            m_pool.Recreate(m_capture_device, to_directx_format(format), depth,
                            winrt::Windows::Graphics::SizeInt32{size.width, size.height});
        } catch (const winrt::hresult_error& e) {
            log_hresult("Direct3D11CaptureFramePool::Recreate", e);
            return false;
        }
        return true;
    }

    std::unique_ptr<CaptureSession> create_session(CaptureItem& item) override {
        auto* wgc_item = dynamic_cast<WgcItem*>(&item);
        if (!wgc_item) {
            LOG_ERROR("Capture item was not created by the WGC platform");
            return nullptr;
        }
        try {
            return std::make_unique<WgcSession>(m_pool.CreateCaptureSession(wgc_item->get_item()));
        } catch (const winrt::hresult_error& e) {
            log_hresult("CreateCaptureSession", e);
            return nullptr;
        }
    }

    void close() override {
        try {
            m_pool.Close();
        } catch (const winrt::hresult_error& e) {
            log_hresult("Direct3D11CaptureFramePool::Close", e);
        }
        m_pool = nullptr;
    }

private:
    winrt::com_ptr<ID3D11Device> m_device;
    winrt::com_ptr<ID3D11DeviceContext> m_context;
    winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice m_capture_device{nullptr};
    Direct3D11CaptureFramePool m_pool{nullptr};
};

// Posting to a thread that already exited just fails
class WgcLoopWaker : public LoopWaker {
public:
    explicit WgcLoopWaker(DWORD thread_id) : m_thread_id(thread_id) {}

    bool wake() override {
        return PostThreadMessageW(m_thread_id, WM_QUIT, 0, 0) != 0;
    }

private:
    DWORD m_thread_id;
};

class WgcMessageLoop : public MessageLoop {
public:
    WgcMessageLoop() : m_thread_id(GetCurrentThreadId()) {}

    ~WgcMessageLoop() override {
        if (m_controller) {
            try {
                // Completion needs this thread's loop, which is done; don't wait
                m_controller.ShutdownQueueAsync();
            } catch (const winrt::hresult_error& e) {
                log_hresult("ShutdownQueueAsync", e);
            }
            m_controller = nullptr;
        }
    }

    bool init() {
        // Force the thread message queue into existence so wake() can post
        MSG msg;
        PeekMessageW(&msg, nullptr, WM_USER, WM_USER, PM_NOREMOVE);

        DispatcherQueueOptions options = {};
        options.dwSize = sizeof(options);
        options.threadType = DQTYPE_THREAD_CURRENT;
        options.apartmentType = DQTAT_COM_NONE;

        HRESULT hr = CreateDispatcherQueueController(
            options,
            reinterpret_cast<ABI::Windows::System::IDispatcherQueueController**>(
                winrt::put_abi(m_controller)));
        if (FAILED(hr)) {
            LOG_ERROR("CreateDispatcherQueueController failed: 0x%08lX",
                      static_cast<unsigned long>(hr));
            return false;
        }

        m_waker = std::make_shared<WgcLoopWaker>(m_thread_id);
        return true;
    }

    void run(const std::function<bool()>& keep_running) override {
        MSG msg;
        uint64_t dispatched = 0;
        while (keep_running()) {
            BOOL result = GetMessageW(&msg, nullptr, 0, 0);
            if (result == 0) {
                break;  // WM_QUIT
            }
            if (result == -1) {
                LOG_ERROR("GetMessage failed: %lu", GetLastError());
                break;
            }
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
            dispatched++;
        }
        LOG_DEBUG("Message loop dispatched %llu messages",
                  static_cast<unsigned long long>(dispatched));
    }

    std::shared_ptr<LoopWaker> waker() const override { return m_waker; }

private:
    DWORD m_thread_id;
    DispatcherQueueController m_controller{nullptr};
    std::shared_ptr<LoopWaker> m_waker;
};

CaptureStatus WgcPlatform::resolve_target(const TargetSpec& target,
                                          std::shared_ptr<CaptureItem>& item) {
    try {
        if (!GraphicsCaptureSession::IsSupported()) {
            LOG_ERROR("Windows.Graphics.Capture is not supported on this system");
            return CaptureStatus::PLATFORM_UNAVAILABLE;
        }
    } catch (const winrt::hresult_error& e) {
        log_hresult("GraphicsCaptureSession::IsSupported", e);
        return CaptureStatus::PLATFORM_UNAVAILABLE;
    }

    GraphicsCaptureItem capture_item{nullptr};
    std::string name;
    CaptureStatus status = CaptureStatus::OK;

    switch (target.kind) {
        case TargetKind::PRIMARY_MONITOR:
        case TargetKind::MONITOR_INDEX:
        case TargetKind::MONITOR_HANDLE: {
            HMONITOR monitor = nullptr;
            if (target.kind == TargetKind::PRIMARY_MONITOR) {
                monitor = primary_monitor();
            } else if (target.kind == TargetKind::MONITOR_INDEX) {
                monitor = monitor_from_index(target.monitor_index);
            } else {
                monitor = reinterpret_cast<HMONITOR>(target.handle);
            }

            TargetInfo info;
            if (!monitor || !query_monitor(monitor, info)) {
                LOG_ERROR("Monitor not found");
                return CaptureStatus::TARGET_NOT_FOUND;
            }
            name = info.name;
            status = create_item_for_monitor(monitor, capture_item);
            break;
        }

        case TargetKind::WINDOW_TITLE:
        case TargetKind::WINDOW_HANDLE:
        case TargetKind::FOREGROUND_WINDOW: {
            HWND window = nullptr;
            if (target.kind == TargetKind::WINDOW_TITLE) {
                window = find_window_by_title(target.window_title);
            } else if (target.kind == TargetKind::WINDOW_HANDLE) {
                window = reinterpret_cast<HWND>(target.handle);
            } else {
                window = GetForegroundWindow();
            }

            if (!window || !IsWindow(window)) {
                LOG_ERROR("Window not found");
                return CaptureStatus::TARGET_NOT_FOUND;
            }
            if (!is_capturable_window(window)) {
                LOG_ERROR("Window '%s' cannot be captured", window_title(window).c_str());
                return CaptureStatus::TARGET_INVALID;
            }
            name = window_title(window);
            status = create_item_for_window(window, capture_item);
            break;
        }

        case TargetKind::PORTAL_MONITOR:
        case TargetKind::PORTAL_WINDOW:
            LOG_ERROR("Portal source selection is only available on PipeWire");
            return CaptureStatus::TARGET_INVALID;
    }

    if (!succeeded(status)) {
        return status;
    }

    item = std::make_shared<WgcItem>(std::move(capture_item), name);
    return CaptureStatus::OK;
}

std::vector<TargetInfo> WgcPlatform::enumerate_targets() {
    std::vector<TargetInfo> targets;

    std::vector<HMONITOR> monitors = enumerate_monitors();
    for (size_t i = 0; i < monitors.size(); i++) {
        TargetInfo info;
        info.kind = TargetKind::MONITOR_INDEX;
        info.index = static_cast<int>(i) + 1;
        if (query_monitor(monitors[i], info)) {
            targets.push_back(std::move(info));
        }
    }

    for (HWND window : enumerate_windows()) {
        std::string title = window_title(window);
        if (title.empty()) {
            continue;
        }

        TargetInfo info;
        info.kind = TargetKind::WINDOW_HANDLE;
        info.handle = reinterpret_cast<uintptr_t>(window);
        info.name = std::move(title);

        wchar_t class_name[256] = {};
        if (GetClassNameW(window, class_name, 256) > 0) {
            info.description = to_utf8(class_name);
        }

        RECT rect;
        if (GetClientRect(window, &rect)) {
            info.size = SizeI{rect.right - rect.left, rect.bottom - rect.top};
        }
        targets.push_back(std::move(info));
    }

    return targets;
}

CaptureStatus WgcPlatform::init_thread() {
    try {
        winrt::init_apartment(winrt::apartment_type::multi_threaded);
    } catch (const winrt::hresult_error& e) {
        log_hresult("RoInitialize", e);
        return CaptureStatus::PLATFORM_INIT_FAILED;
    }
    return CaptureStatus::OK;
}

void WgcPlatform::uninit_thread() {
    winrt::uninit_apartment();
}

std::unique_ptr<MessageLoop> WgcPlatform::create_message_loop() {
    auto loop = std::make_unique<WgcMessageLoop>();
    if (!loop->init()) {
        return nullptr;
    }
    return loop;
}

CaptureStatus WgcPlatform::create_graphics_device(MessageLoop& /*loop*/,
                                                  std::shared_ptr<GraphicsDevice>& device) {
    winrt::com_ptr<ID3D11Device> d3d_device;
    winrt::com_ptr<ID3D11DeviceContext> context;
    CaptureStatus status = create_d3d_device(d3d_device, context);
    if (!succeeded(status)) {
        return status;
    }

    winrt::Windows::Graphics::DirectX::Direct3D11::IDirect3DDevice capture_device{nullptr};
    status = wrap_device_for_capture(d3d_device.get(), capture_device);
    if (!succeeded(status)) {
        return status;
    }

    device = std::make_shared<WgcDevice>(std::move(d3d_device), std::move(context),
                                         std::move(capture_device));
    return CaptureStatus::OK;
}

CaptureStatus WgcPlatform::create_frame_pool(GraphicsDevice& device, PixelFormat format,
                                             int depth, SizeI size,
                                             std::unique_ptr<FramePool>& pool) {
    auto* wgc_device = dynamic_cast<WgcDevice*>(&device);
    if (!wgc_device) {
        LOG_ERROR("Graphics device was not created by the WGC platform");
        return CaptureStatus::DEVICE_CREATION_FAILED;
    }

    try {
        Direct3D11CaptureFramePool frame_pool = Direct3D11CaptureFramePool::Create(
            wgc_device->get_capture_device(), to_directx_format(format), depth,
            winrt::Windows::Graphics::SizeInt32{size.width, size.height});
        pool = std::make_unique<WgcFramePool>(*wgc_device, std::move(frame_pool));
    } catch (const winrt::hresult_error& e) {
        log_hresult("Direct3D11CaptureFramePool::Create", e);
        return CaptureStatus::SESSION_CREATION_FAILED;
    }
    return CaptureStatus::OK;
}

}  // namespace pixel_forge

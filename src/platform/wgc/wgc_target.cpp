#include "../../util/logger.hpp"
#include "wgc_target.hpp"

#include <windows.graphics.capture.interop.h>

namespace pixel_forge {

using winrt::Windows::Graphics::Capture::GraphicsCaptureItem;

std::string to_utf8(const wchar_t* text) {
    if (!text || text[0] == L'\0') {
        return std::string();
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 1) {
        return std::string();
    }
    std::string result(static_cast<size_t>(len - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text, -1, &result[0], len, nullptr, nullptr);
    return result;
}

static std::wstring to_wide(const std::string& text) {
    if (text.empty()) {
        return std::wstring();
    }
    int len = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, nullptr, 0);
    if (len <= 1) {
        return std::wstring();
    }
    std::wstring result(static_cast<size_t>(len - 1), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, &result[0], len);
    return result;
}

static BOOL CALLBACK enum_monitors_cb(HMONITOR monitor, HDC, LPRECT, LPARAM data) {
    reinterpret_cast<std::vector<HMONITOR>*>(data)->push_back(monitor);
    return TRUE;
}

std::vector<HMONITOR> enumerate_monitors() {
    std::vector<HMONITOR> monitors;
    if (!EnumDisplayMonitors(nullptr, nullptr, enum_monitors_cb,
                             reinterpret_cast<LPARAM>(&monitors))) {
        LOG_ERROR("EnumDisplayMonitors failed: %lu", GetLastError());
    }
    return monitors;
}

HMONITOR primary_monitor() {
    // The primary monitor always has its origin at (0, 0)
    POINT origin = {0, 0};
    return MonitorFromPoint(origin, MONITOR_DEFAULTTONULL);
}

HMONITOR monitor_from_index(int index) {
    if (index < 1) {
        LOG_ERROR("Monitor index %d is lower than one", index);
        return nullptr;
    }
    std::vector<HMONITOR> monitors = enumerate_monitors();
    if (static_cast<size_t>(index) > monitors.size()) {
        LOG_ERROR("Monitor %d not found (%zu connected)", index, monitors.size());
        return nullptr;
    }
    return monitors[index - 1];
}

bool query_monitor(HMONITOR monitor, TargetInfo& info) {
    MONITORINFOEXW monitor_info = {};
    monitor_info.cbSize = sizeof(monitor_info);
    if (!GetMonitorInfoW(monitor, &monitor_info)) {
        return false;
    }

    info.handle = reinterpret_cast<uintptr_t>(monitor);
    info.name = to_utf8(monitor_info.szDevice);

    DEVMODEW mode = {};
    mode.dmSize = sizeof(mode);
    if (EnumDisplaySettingsW(monitor_info.szDevice, ENUM_CURRENT_SETTINGS, &mode)) {
        info.size = SizeI{static_cast<int>(mode.dmPelsWidth), static_cast<int>(mode.dmPelsHeight)};
        info.refresh_rate = static_cast<int>(mode.dmDisplayFrequency);
    } else {
        const RECT& rc = monitor_info.rcMonitor;
        info.size = SizeI{rc.right - rc.left, rc.bottom - rc.top};
    }

    DISPLAY_DEVICEW device = {};
    device.cb = sizeof(device);
    if (EnumDisplayDevicesW(monitor_info.szDevice, 0, &device, 0)) {
        info.description = to_utf8(device.DeviceString);
    }
    return true;
}

bool is_capturable_window(HWND window) {
    if (!IsWindowVisible(window)) {
        return false;
    }

    DWORD process_id = 0;
    GetWindowThreadProcessId(window, &process_id);
    if (process_id == GetCurrentProcessId()) {
        return false;
    }

    RECT rect;
    if (!GetClientRect(window, &rect)) {
        return false;
    }

    LONG_PTR styles = GetWindowLongPtrW(window, GWL_STYLE);
    LONG_PTR ex_styles = GetWindowLongPtrW(window, GWL_EXSTYLE);
    if (ex_styles & WS_EX_TOOLWINDOW) {
        return false;
    }
    if (styles & WS_CHILD) {
        return false;
    }
    return true;
}

static BOOL CALLBACK enum_windows_cb(HWND window, LPARAM data) {
    if (is_capturable_window(window)) {
        reinterpret_cast<std::vector<HWND>*>(data)->push_back(window);
    }
    return TRUE;
}

std::vector<HWND> enumerate_windows() {
    std::vector<HWND> windows;
    EnumChildWindows(GetDesktopWindow(), enum_windows_cb, reinterpret_cast<LPARAM>(&windows));
    return windows;
}

HWND find_window_by_title(const std::string& title) {
    std::wstring wide_title = to_wide(title);
    return FindWindowW(nullptr, wide_title.c_str());
}

std::string window_title(HWND window) {
    int len = GetWindowTextLengthW(window);
    if (len <= 0) {
        return std::string();
    }
    std::wstring text(static_cast<size_t>(len) + 1, L'\0');
    int copied = GetWindowTextW(window, &text[0], len + 1);
    if (copied <= 0) {
        return std::string();
    }
    text.resize(static_cast<size_t>(copied));
    return to_utf8(text.c_str());
}

CaptureStatus create_item_for_monitor(HMONITOR monitor, GraphicsCaptureItem& item) {
    try {
        auto interop = winrt::get_activation_factory<GraphicsCaptureItem, IGraphicsCaptureItemInterop>();
        HRESULT hr = interop->CreateForMonitor(monitor, winrt::guid_of<GraphicsCaptureItem>(),
                                               winrt::put_abi(item));
        if (FAILED(hr) || !item) {
            LOG_ERROR("CreateForMonitor failed: 0x%08lX", static_cast<unsigned long>(hr));
            return CaptureStatus::TARGET_INVALID;
        }
    } catch (const winrt::hresult_error& e) {
        LOG_ERROR("CreateForMonitor failed: 0x%08X %ls",
                  static_cast<unsigned>(e.code().value), e.message().c_str());
        return CaptureStatus::PLATFORM_UNAVAILABLE;
    }
    return CaptureStatus::OK;
}

CaptureStatus create_item_for_window(HWND window, GraphicsCaptureItem& item) {
    try {
        auto interop = winrt::get_activation_factory<GraphicsCaptureItem, IGraphicsCaptureItemInterop>();
        HRESULT hr = interop->CreateForWindow(window, winrt::guid_of<GraphicsCaptureItem>(),
                                              winrt::put_abi(item));
        if (FAILED(hr) || !item) {
            LOG_ERROR("CreateForWindow failed: 0x%08lX", static_cast<unsigned long>(hr));
            return CaptureStatus::TARGET_INVALID;
        }
    } catch (const winrt::hresult_error& e) {
        LOG_ERROR("CreateForWindow failed: 0x%08X %ls",
                  static_cast<unsigned>(e.code().value), e.message().c_str());
        return CaptureStatus::PLATFORM_UNAVAILABLE;
    }
    return CaptureStatus::OK;
}

WgcItem::WgcItem(GraphicsCaptureItem item, std::string name)
    : m_item(std::move(item))
    , m_name(std::move(name)) {
}

SizeI WgcItem::size() const {
    auto size = m_item.Size();
    return SizeI{size.Width, size.Height};
}

EventToken WgcItem::add_closed_handler(std::function<void()> handler) {
    winrt::event_token token = m_item.Closed(
        [handler = std::move(handler)](const GraphicsCaptureItem&,
                                       const winrt::Windows::Foundation::IInspectable&) {
            handler();
        });
    return token.value;
}

void WgcItem::remove_closed_handler(EventToken token) {
    m_item.Closed(winrt::event_token{token});
}

}  // namespace pixel_forge

#pragma once

// Include after util/logger.hpp: wingdi.h defines ERROR.
#include "../capture_platform.hpp"

#include <windows.h>
#include <winrt/Windows.Graphics.Capture.h>

#include <string>
#include <vector>

namespace pixel_forge {

// Monitors in EnumDisplayMonitors order
std::vector<HMONITOR> enumerate_monitors();

HMONITOR primary_monitor();

// 1-based, matching the display numbers the system settings show
HMONITOR monitor_from_index(int index);

// Fill name/description/size/refresh rate. Returns false if the monitor is gone.
bool query_monitor(HMONITOR monitor, TargetInfo& info);

// Top-level windows that pass is_capturable_window()
std::vector<HWND> enumerate_windows();

HWND find_window_by_title(const std::string& title);

// Visible, owned by another process, not a tool window and not a child window
bool is_capturable_window(HWND window);

std::string window_title(HWND window);

std::string to_utf8(const wchar_t* text);

CaptureStatus create_item_for_monitor(HMONITOR monitor,
                                      winrt::Windows::Graphics::Capture::GraphicsCaptureItem& item);
CaptureStatus create_item_for_window(HWND window,
                                     winrt::Windows::Graphics::Capture::GraphicsCaptureItem& item);

class WgcItem : public CaptureItem {
public:
    WgcItem(winrt::Windows::Graphics::Capture::GraphicsCaptureItem item, std::string name);

    SizeI size() const override;
    std::string display_name() const override { return m_name; }

    EventToken add_closed_handler(std::function<void()> handler) override;
    void remove_closed_handler(EventToken token) override;

    const winrt::Windows::Graphics::Capture::GraphicsCaptureItem& get_item() const { return m_item; }

private:
    winrt::Windows::Graphics::Capture::GraphicsCaptureItem m_item{nullptr};
    std::string m_name;
};

}  // namespace pixel_forge

#pragma once

#include <cstdint>
#include <string>

namespace pixel_forge {

enum class PixelFormat {
    RGBA8,   // DXGI_FORMAT_R8G8B8A8_UNORM
    BGRA8    // DXGI_FORMAT_B8G8R8A8_UNORM
};

// Every supported format is 4 bytes per pixel; the crop math depends on it.
constexpr int BYTES_PER_PIXEL = 4;

struct CaptureConfig {
    PixelFormat pixel_format = PixelFormat::RGBA8;
    int frame_pool_depth = 1;

    // Consumer-side polling
    int first_frame_poll_interval_ms = 10;

    // Shutdown watchdog: how long stop() waits for the capture loop to exit
    int stop_timeout_ms = 100;
    int stop_poll_interval_ms = 5;
};

// Capture platform selection
enum class PlatformType {
    AUTO,       // Windows -> WGC, Linux -> PipeWire
    WGC,        // Windows.Graphics.Capture + Direct3D 11
    PIPEWIRE    // xdg-desktop-portal ScreenCast + PipeWire
};

enum class TargetKind {
    PRIMARY_MONITOR,
    MONITOR_INDEX,      // 1-based
    MONITOR_HANDLE,
    WINDOW_TITLE,
    WINDOW_HANDLE,
    FOREGROUND_WINDOW,
    PORTAL_MONITOR,     // interactive portal picker, monitors only
    PORTAL_WINDOW       // interactive portal picker, windows only
};

struct TargetSpec {
    TargetKind kind = TargetKind::PRIMARY_MONITOR;
    int monitor_index = 1;
    std::string window_title;
    uintptr_t handle = 0;
};

struct GrabToolConfig {
    PlatformType platform = PlatformType::AUTO;
    TargetSpec target;
    double duration_s = 1.0;
    bool await_first_frame = true;
    bool list_targets = false;
    std::string output_path;     // empty = don't write the last frame
    int verbosity = 0;
    CaptureConfig capture;
};

}  // namespace pixel_forge

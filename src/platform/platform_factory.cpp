#include "platform_factory.hpp"
#include "../util/logger.hpp"

#include <cstdlib>

#ifdef HAVE_WGC
#include "wgc/wgc_platform.hpp"
#endif

#ifdef HAVE_PIPEWIRE
#include "pipewire/pipewire_platform.hpp"
#endif

namespace pixel_forge {

const char* to_string(PlatformType type) {
    switch (type) {
        case PlatformType::AUTO:     return "auto";
        case PlatformType::WGC:      return "wgc";
        case PlatformType::PIPEWIRE: return "pipewire";
    }
    return "unknown";
}

std::shared_ptr<CapturePlatform> create_platform(PlatformType type) {
    PlatformType platform = type;

    // Auto-detect if needed
    if (platform == PlatformType::AUTO) {
#ifdef HAVE_WGC
        platform = PlatformType::WGC;
#else
        const char* wayland_display = std::getenv("WAYLAND_DISPLAY");
        const char* x11_display = std::getenv("DISPLAY");

        if ((wayland_display && wayland_display[0] != '\0') ||
            (x11_display && x11_display[0] != '\0')) {
#ifdef HAVE_PIPEWIRE
            LOG_DEBUG("Detected desktop session, using PipeWire capture");
            platform = PlatformType::PIPEWIRE;
#else
            LOG_ERROR("Desktop session detected but PipeWire capture not compiled in");
            return nullptr;
#endif
        } else {
            LOG_ERROR("No display session detected (WAYLAND_DISPLAY and DISPLAY not set)");
            return nullptr;
        }
#endif
    }

    switch (platform) {
        case PlatformType::WGC:
#ifdef HAVE_WGC
            LOG_DEBUG("Creating Windows.Graphics.Capture platform");
            return std::make_shared<WgcPlatform>();
#else
            LOG_ERROR("Windows.Graphics.Capture not compiled in");
            return nullptr;
#endif

        case PlatformType::PIPEWIRE:
#ifdef HAVE_PIPEWIRE
            LOG_DEBUG("Creating PipeWire platform");
            return std::make_shared<PipeWirePlatform>();
#else
            LOG_ERROR("PipeWire capture not compiled in");
            return nullptr;
#endif

        case PlatformType::AUTO:
            break;
    }
    return nullptr;
}

}  // namespace pixel_forge

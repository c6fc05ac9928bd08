#pragma once

#include "../capture_platform.hpp"

namespace pixel_forge {

// xdg-desktop-portal ScreenCast + PipeWire. The portal picks the target;
// the capture thread owns a pw_loop and consumes the portal's stream node.
class PipeWirePlatform : public CapturePlatform {
public:
    PipeWirePlatform() = default;

    const char* get_name() const override { return "PipeWire"; }

    // PRIMARY_MONITOR and PORTAL_MONITOR show the monitor picker, PORTAL_WINDOW
    // the window picker. Handle and title targets have no portal equivalent.
    CaptureStatus resolve_target(const TargetSpec& target,
                                 std::shared_ptr<CaptureItem>& item) override;

    // Empty: targets are chosen interactively
    std::vector<TargetInfo> enumerate_targets() override { return {}; }

    CaptureStatus init_thread() override;
    void uninit_thread() override;

    std::unique_ptr<MessageLoop> create_message_loop() override;

    CaptureStatus create_graphics_device(MessageLoop& loop,
                                         std::shared_ptr<GraphicsDevice>& device) override;

    CaptureStatus create_frame_pool(GraphicsDevice& device, PixelFormat format,
                                    int depth, SizeI size,
                                    std::unique_ptr<FramePool>& pool) override;
};

}  // namespace pixel_forge

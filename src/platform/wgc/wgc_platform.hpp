#pragma once

#include "../capture_platform.hpp"

namespace pixel_forge {

// Windows.Graphics.Capture on a Direct3D 11 device. The capture thread runs a
// Win32 message loop with a DispatcherQueue attached, which the frame pool
// needs to raise FrameArrived on that thread.
class WgcPlatform : public CapturePlatform {
public:
    WgcPlatform() = default;

    const char* get_name() const override { return "Windows.Graphics.Capture"; }

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
};

}  // namespace pixel_forge

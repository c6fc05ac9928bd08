#include "capture/frame_pool_manager.hpp"
#include "capture/surface_converter.hpp"
#include "fake_platform.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace pixel_forge;
using fake::FakeOptions;
using fake::FakePlatform;

namespace {

// Drives a FramePoolManager on the test thread, as the capture thread would
class FramePoolManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        FakeOptions options;
        options.emit_on_start = false;
        platform = std::make_unique<FakePlatform>(options);
    }

    CaptureStatus open_manager() {
        loop = platform->create_message_loop();
        EXPECT_EQ(platform->create_graphics_device(*loop, device), CaptureStatus::OK);

        TargetSpec target;
        EXPECT_EQ(platform->resolve_target(target, item), CaptureStatus::OK);

        state = std::make_shared<SessionState>();
        manager = std::make_unique<FramePoolManager>(*platform, device, item, state, config);
        return manager->open();
    }

    SizeI mailbox_frame_size() const {
        auto frame = state->mailbox.peek();
        if (!frame) return {};
        return {frame->width(), frame->height()};
    }

    std::unique_ptr<FakePlatform> platform;
    std::unique_ptr<MessageLoop> loop;
    std::shared_ptr<GraphicsDevice> device;
    std::shared_ptr<CaptureItem> item;
    std::shared_ptr<SessionState> state;
    CaptureConfig config;
    std::unique_ptr<FramePoolManager> manager;
};

}  // namespace

TEST_F(FramePoolManagerTest, OpenCreatesPoolAtTargetSize) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);

    EXPECT_TRUE(manager->is_open());
    ASSERT_NE(platform->pool(), nullptr);
    EXPECT_EQ(platform->pool()->size(), (SizeI{800, 600}));
    EXPECT_EQ(platform->pool_depth(), 1);
    EXPECT_EQ(platform->pool_format(), PixelFormat::RGBA8);
    EXPECT_EQ(platform->pool()->handler_count(), 1u);
    EXPECT_EQ(platform->last_item()->handler_count(), 1u);
    EXPECT_TRUE(platform->log()->contains("session_started"));
}

TEST_F(FramePoolManagerTest, UsesConfiguredFormatAndDepth) {
    config.pixel_format = PixelFormat::BGRA8;
    config.frame_pool_depth = 2;
    ASSERT_EQ(open_manager(), CaptureStatus::OK);

    EXPECT_EQ(platform->pool_depth(), 2);
    EXPECT_EQ(platform->pool_format(), PixelFormat::BGRA8);
}

TEST_F(FramePoolManagerTest, FrameAtCurrentSizeReachesMailbox) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);
    EXPECT_FALSE(state->mailbox.has_value());

    platform->pool()->emit({800, 600}, 1);

    EXPECT_EQ(mailbox_frame_size(), (SizeI{800, 600}));
    EXPECT_EQ(state->frames_delivered.load(), 1u);
    EXPECT_EQ(state->mailbox.peek()->timestamp_us(), 1000);

    platform->pool()->emit({800, 600}, 2);
    EXPECT_EQ(state->frames_delivered.load(), 2u);
    EXPECT_EQ(state->mailbox.peek()->timestamp_us(), 1000 + 16667);
}

TEST_F(FramePoolManagerTest, ResizeRecreatesPoolAndDropsFrame) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);

    platform->pool()->emit({800, 600}, 1);
    ASSERT_EQ(mailbox_frame_size(), (SizeI{800, 600}));

    platform->pool()->emit({1024, 768}, 2);
    ASSERT_EQ(platform->pool()->recreate_sizes().size(), 1u);
    EXPECT_EQ(platform->pool()->recreate_sizes()[0], (SizeI{1024, 768}));
    EXPECT_EQ(platform->pool()->size(), (SizeI{1024, 768}));
    EXPECT_EQ(manager->last_size(), (SizeI{1024, 768}));
    EXPECT_EQ(manager->resize_count(), 1u);

    // The resize event does not publish
    EXPECT_EQ(mailbox_frame_size(), (SizeI{800, 600}));
    EXPECT_EQ(state->frames_delivered.load(), 1u);

    platform->pool()->emit({1024, 768}, 3);
    EXPECT_EQ(mailbox_frame_size(), (SizeI{1024, 768}));
    EXPECT_EQ(state->frames_delivered.load(), 2u);
    EXPECT_EQ(platform->pool()->recreate_sizes().size(), 1u);
}

TEST_F(FramePoolManagerTest, PublishedFrameMaterializesCroppedContent) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);
    platform->pool()->emit({800, 600}, 4);

    auto frame = state->mailbox.peek();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->state(), Frame::State::GPU_ONLY);

    RawImage raw;
    ASSERT_EQ(frame->materialize(raw), CaptureStatus::OK);
    EXPECT_EQ(raw.row_pitch, fake::padded_pitch(800));

    std::vector<uint8_t> pixels;
    ASSERT_EQ(crop_to_content(raw, frame->width(), frame->height(), pixels), CaptureStatus::OK);
    ASSERT_EQ(pixels.size(), 800u * 600u * 4u);
    EXPECT_EQ(pixels[0], fake::pattern_byte(4, 0, 0, 0));
    EXPECT_EQ(pixels[pixels.size() - 1], fake::pattern_byte(4, 799, 599, 3));
}

TEST_F(FramePoolManagerTest, CpuFrameIsPublishedMaterialized) {
    platform->options().cpu_frames = true;
    ASSERT_EQ(open_manager(), CaptureStatus::OK);
    platform->pool()->emit({800, 600}, 6);

    auto frame = state->mailbox.peek();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->state(), Frame::State::MATERIALIZED);
    EXPECT_EQ(frame->timestamp_us(), 1000);

    RawImage first;
    RawImage second;
    ASSERT_EQ(frame->materialize(first), CaptureStatus::OK);
    ASSERT_EQ(frame->materialize(second), CaptureStatus::OK);
    EXPECT_EQ(first.data, second.data);
    EXPECT_EQ(first.row_pitch, fake::padded_pitch(800));
    EXPECT_EQ(first.height, 600);

    std::vector<uint8_t> pixels;
    ASSERT_EQ(crop_to_content(first, frame->width(), frame->height(), pixels), CaptureStatus::OK);
    ASSERT_EQ(pixels.size(), 800u * 600u * 4u);
    EXPECT_EQ(pixels[0], fake::pattern_byte(6, 0, 0, 0));
    EXPECT_EQ(pixels[pixels.size() - 1], fake::pattern_byte(6, 799, 599, 3));
}

TEST_F(FramePoolManagerTest, IgnoresFramesOnceStopping) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);
    state->request_stop();

    platform->pool()->emit({800, 600}, 1);

    EXPECT_EQ(platform->pool()->try_get_count(), 0);
    EXPECT_FALSE(state->mailbox.has_value());
    EXPECT_EQ(state->frames_delivered.load(), 0u);
}

TEST_F(FramePoolManagerTest, TargetClosedRequestsStop) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);
    EXPECT_FALSE(state->stopping());

    platform->last_item()->fire_closed();

    EXPECT_TRUE(state->stopping());
}

TEST_F(FramePoolManagerTest, EmptyEventIsIgnored) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);

    // Nothing pending: FrameArrived raced an earlier TryGetNextFrame
    manager->on_frame_arrived();

    EXPECT_EQ(platform->pool()->try_get_count(), 1);
    EXPECT_FALSE(state->mailbox.has_value());
}

TEST_F(FramePoolManagerTest, ZeroSizedTargetIsInvalid) {
    platform->options().target_size = {0, 0};
    EXPECT_EQ(open_manager(), CaptureStatus::TARGET_INVALID);
    EXPECT_EQ(platform->pool(), nullptr);
}

TEST_F(FramePoolManagerTest, SessionCreationFailure) {
    platform->options().fail_session_creation = true;
    EXPECT_EQ(open_manager(), CaptureStatus::SESSION_CREATION_FAILED);
    EXPECT_FALSE(manager->is_open());
}

TEST_F(FramePoolManagerTest, SessionStartFailure) {
    platform->options().fail_session_start = true;
    EXPECT_EQ(open_manager(), CaptureStatus::SESSION_CREATION_FAILED);

    manager->close();
    EXPECT_TRUE(platform->log()->contains("frame_arrived_removed"));
    EXPECT_TRUE(platform->log()->contains("session_closed"));
}

TEST_F(FramePoolManagerTest, CloseTearsDownInOrder) {
    ASSERT_EQ(open_manager(), CaptureStatus::OK);
    auto fake_item = platform->last_item();

    manager->close();
    manager->close();

    std::vector<std::string> expected = {
        "pool_created", "session_started", "frame_arrived_removed",
        "closed_removed", "session_closed", "pool_closed"
    };
    EXPECT_EQ(platform->log()->entries(), expected);
    EXPECT_EQ(fake_item->handler_count(), 0u);
    EXPECT_FALSE(manager->is_open());
}

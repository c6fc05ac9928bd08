#include "util/image_writer.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace pixel_forge;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

MaterializedFrame two_pixel_frame() {
    MaterializedFrame frame;
    frame.width = 2;
    frame.height = 1;
    frame.pixels = {1, 2, 3, 4, 5, 6, 7, 8};
    return frame;
}

const char* const PAM_HEADER =
    "P7\nWIDTH 2\nHEIGHT 1\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n";

}  // namespace

TEST(ImageWriterTest, WritesRgbaPam) {
    const std::string path = ::testing::TempDir() + "pixel_forge_rgba.pam";
    ASSERT_TRUE(write_pam(path, two_pixel_frame(), PixelFormat::RGBA8));

    std::string expected = PAM_HEADER;
    expected += std::string("\x01\x02\x03\x04\x05\x06\x07\x08", 8);
    EXPECT_EQ(read_file(path), expected);
    std::remove(path.c_str());
}

TEST(ImageWriterTest, ReordersBgraToRgba) {
    const std::string path = ::testing::TempDir() + "pixel_forge_bgra.pam";
    MaterializedFrame frame = two_pixel_frame();
    ASSERT_TRUE(write_pam(path, frame, PixelFormat::BGRA8));

    std::string expected = PAM_HEADER;
    expected += std::string("\x03\x02\x01\x04\x07\x06\x05\x08", 8);
    EXPECT_EQ(read_file(path), expected);

    // The caller's frame is untouched
    EXPECT_EQ(frame.pixels, two_pixel_frame().pixels);
    std::remove(path.c_str());
}

TEST(ImageWriterTest, RejectsInconsistentFrame) {
    const std::string path = ::testing::TempDir() + "pixel_forge_bad.pam";
    MaterializedFrame frame = two_pixel_frame();
    frame.pixels.pop_back();
    EXPECT_FALSE(write_pam(path, frame, PixelFormat::RGBA8));

    MaterializedFrame empty;
    EXPECT_FALSE(write_pam(path, empty, PixelFormat::RGBA8));
}

TEST(ImageWriterTest, FailsOnUnwritablePath) {
    EXPECT_FALSE(write_pam("/nonexistent-dir/frame.pam", two_pixel_frame(), PixelFormat::RGBA8));
}

#include "image_writer.hpp"
#include "logger.hpp"

#include <cstdio>
#include <vector>

namespace pixel_forge {

bool write_pam(const std::string& path, const MaterializedFrame& frame, PixelFormat format) {
    const size_t expected = static_cast<size_t>(frame.width) * frame.height * BYTES_PER_PIXEL;
    if (frame.width <= 0 || frame.height <= 0 || frame.pixels.size() != expected) {
        LOG_ERROR("Refusing to write %dx%d frame with %zu bytes",
                  frame.width, frame.height, frame.pixels.size());
        return false;
    }

    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("Failed to open %s for writing", path.c_str());
        return false;
    }

    fprintf(file, "P7\nWIDTH %d\nHEIGHT %d\nDEPTH 4\nMAXVAL 255\nTUPLTYPE RGB_ALPHA\nENDHDR\n",
            frame.width, frame.height);

    size_t written;
    if (format == PixelFormat::BGRA8) {
        std::vector<uint8_t> rgba(frame.pixels);
        swap_red_blue(rgba.data(), rgba.size() / BYTES_PER_PIXEL);
        written = fwrite(rgba.data(), 1, rgba.size(), file);
    } else {
        written = fwrite(frame.pixels.data(), 1, frame.pixels.size(), file);
    }

    bool ok = written == expected;
    if (fclose(file) != 0) {
        ok = false;
    }
    if (!ok) {
        LOG_ERROR("Failed to write %s", path.c_str());
        return false;
    }

    LOG_INFO("Wrote %dx%d frame to %s", frame.width, frame.height, path.c_str());
    return true;
}

}  // namespace pixel_forge

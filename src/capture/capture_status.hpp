#pragma once

namespace pixel_forge {

enum class CaptureStatus {
    OK,
    NOT_RUNNING,                  // No active capture thread
    NO_FRAME_AVAILABLE,           // Mailbox is empty
    FRAME_CONVERSION_FAILED,      // Staging copy, copy or map failed
    ALREADY_STARTED,
    TARGET_NOT_FOUND,
    TARGET_INVALID,
    PLATFORM_UNAVAILABLE,         // No capture backend compiled in or usable
    PLATFORM_INIT_FAILED,
    FEATURE_LEVEL_NOT_SATISFIED,
    DEVICE_CREATION_FAILED,
    SESSION_CREATION_FAILED
};

const char* to_string(CaptureStatus status);

inline bool succeeded(CaptureStatus status) { return status == CaptureStatus::OK; }

}  // namespace pixel_forge

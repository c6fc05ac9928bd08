#include "capture_status.hpp"

namespace pixel_forge {

const char* to_string(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::OK:                          return "ok";
        case CaptureStatus::NOT_RUNNING:                 return "capture thread is not running";
        case CaptureStatus::NO_FRAME_AVAILABLE:          return "no frame available yet";
        case CaptureStatus::FRAME_CONVERSION_FAILED:     return "frame could not be materialized";
        case CaptureStatus::ALREADY_STARTED:             return "capture already started";
        case CaptureStatus::TARGET_NOT_FOUND:            return "capture target not found";
        case CaptureStatus::TARGET_INVALID:              return "capture target is not capturable";
        case CaptureStatus::PLATFORM_UNAVAILABLE:        return "no capture platform available";
        case CaptureStatus::PLATFORM_INIT_FAILED:        return "capture platform initialization failed";
        case CaptureStatus::FEATURE_LEVEL_NOT_SATISFIED: return "graphics device does not reach the required feature level";
        case CaptureStatus::DEVICE_CREATION_FAILED:      return "graphics device creation failed";
        case CaptureStatus::SESSION_CREATION_FAILED:     return "capture session creation failed";
    }
    return "unknown";
}

}  // namespace pixel_forge

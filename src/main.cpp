#include "capture/capture_controller.hpp"
#include "platform/platform_factory.hpp"
#include "util/image_writer.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <thread>

using namespace pixel_forge;

static volatile sig_atomic_t g_signal_count = 0;

static void signal_handler(int /*sig*/) {
    g_signal_count = g_signal_count + 1;
    if (g_signal_count > 1) {
        // Second signal - give up on a clean stop
        exit(1);
    }
}

static void print_usage(const char* prog) {
    printf("Usage: %s [options]\n", prog);
    printf("Options:\n");
    printf("  -b, --backend BACKEND   Capture backend: auto, wgc, pipewire (default: auto)\n");
    printf("  -m, --monitor N         Capture monitor N, 1-based (default: primary monitor)\n");
    printf("  -w, --window TITLE      Capture the window with this exact title\n");
    printf("  -F, --foreground        Capture the foreground window\n");
    printf("  -W, --portal-window     Pick a window in the portal dialog (PipeWire)\n");
    printf("  -l, --list              List capturable monitors and windows, then exit\n");
    printf("  -d, --duration SEC      Capture duration in seconds (default: 1)\n");
    printf("  -n, --no-wait           Don't wait for the first frame before timing\n");
    printf("  -o, --output FILE       Write the last frame as a PAM image\n");
    printf("  -v, --verbose           Enable info logging (use -vv for debug)\n");
    printf("  -h, --help              Show this help\n");
    printf("\nThe PIXEL_FORGE_LOG environment variable (debug, info, warn, error)\n");
    printf("sets the log level when no -v is given.\n");
    printf("\nCapture backends:\n");
    printf("  auto      Auto-detect (Windows->WGC, Linux desktop session->PipeWire)\n");
#ifdef HAVE_WGC
    printf("  wgc       Windows.Graphics.Capture (monitors and windows)\n");
#endif
#ifdef HAVE_PIPEWIRE
    printf("  pipewire  PipeWire/Portal screencast (target chosen in the portal dialog)\n");
#endif
}

static const char* kind_label(TargetKind kind) {
    switch (kind) {
        case TargetKind::PRIMARY_MONITOR:
        case TargetKind::MONITOR_INDEX:
        case TargetKind::MONITOR_HANDLE:
        case TargetKind::PORTAL_MONITOR:
            return "monitor";
        case TargetKind::WINDOW_TITLE:
        case TargetKind::WINDOW_HANDLE:
        case TargetKind::FOREGROUND_WINDOW:
        case TargetKind::PORTAL_WINDOW:
            return "window";
    }
    return "target";
}

static int list_targets(CapturePlatform& platform) {
    std::vector<TargetInfo> targets = platform.enumerate_targets();
    if (targets.empty()) {
        printf("%s has no enumerable targets", platform.get_name());
        printf(" (targets are picked interactively)\n");
        return 0;
    }

    for (const TargetInfo& info : targets) {
        if (info.index > 0) {
            printf("%-7s %2d  %-20s %5dx%-5d %3d Hz  %s\n", kind_label(info.kind), info.index,
                   info.name.c_str(), info.size.width, info.size.height, info.refresh_rate,
                   info.description.c_str());
        } else {
            printf("%-7s 0x%-10llx %5dx%-5d  %s [%s]\n", kind_label(info.kind),
                   static_cast<unsigned long long>(info.handle), info.size.width,
                   info.size.height, info.name.c_str(), info.description.c_str());
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    GrabToolConfig config;

    static struct option long_options[] = {
        {"backend", required_argument, 0, 'b'},
        {"monitor", required_argument, 0, 'm'},
        {"window", required_argument, 0, 'w'},
        {"foreground", no_argument, 0, 'F'},
        {"portal-window", no_argument, 0, 'W'},
        {"list", no_argument, 0, 'l'},
        {"duration", required_argument, 0, 'd'},
        {"no-wait", no_argument, 0, 'n'},
        {"output", required_argument, 0, 'o'},
        {"verbose", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "b:m:w:FWld:no:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'b':
                if (strcmp(optarg, "auto") == 0) {
                    config.platform = PlatformType::AUTO;
                } else if (strcmp(optarg, "wgc") == 0) {
                    config.platform = PlatformType::WGC;
                } else if (strcmp(optarg, "pipewire") == 0 || strcmp(optarg, "pw") == 0) {
                    config.platform = PlatformType::PIPEWIRE;
                } else {
                    fprintf(stderr, "Unknown capture backend: %s\n", optarg);
                    print_usage(argv[0]);
                    return 1;
                }
                break;
            case 'm':
                config.target.kind = TargetKind::MONITOR_INDEX;
                config.target.monitor_index = atoi(optarg);
                if (config.target.monitor_index < 1) {
                    fprintf(stderr, "Monitor index must be 1 or greater: %s\n", optarg);
                    return 1;
                }
                break;
            case 'w':
                config.target.kind = TargetKind::WINDOW_TITLE;
                config.target.window_title = optarg;
                break;
            case 'F':
                config.target.kind = TargetKind::FOREGROUND_WINDOW;
                break;
            case 'W':
                config.target.kind = TargetKind::PORTAL_WINDOW;
                break;
            case 'l':
                config.list_targets = true;
                break;
            case 'd':
                config.duration_s = atof(optarg);
                if (config.duration_s < 0.0) config.duration_s = 0.0;
                break;
            case 'n':
                config.await_first_frame = false;
                break;
            case 'o':
                config.output_path = optarg;
                break;
            case 'v':
                config.verbosity++;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    // Apply verbosity level: -v = INFO, -vv = DEBUG
    if (config.verbosity >= 2) {
        Logger::set_level(LogLevel::DEBUG);
    } else if (config.verbosity == 1) {
        Logger::set_level(LogLevel::INFO);
    } else {
        Logger::set_level(Logger::parse_level(std::getenv("PIXEL_FORGE_LOG"), LogLevel::WARN));
    }

    std::shared_ptr<CapturePlatform> platform = create_platform(config.platform);
    if (!platform) {
        fprintf(stderr, "No capture backend available (%s)\n", to_string(config.platform));
        return 1;
    }

    if (config.list_targets) {
        return list_targets(*platform);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    CaptureController controller(platform, config.capture);

    CaptureStatus status = controller.start(config.target, config.await_first_frame);
    if (!succeeded(status)) {
        fprintf(stderr, "Failed to start capture: %s\n", to_string(status));
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration<double>(config.duration_s);
    while (g_signal_count == 0 &&
           controller.state() == CaptureState::RUNNING &&
           std::chrono::steady_clock::now() - start < duration) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (controller.state() == CaptureState::STOPPING) {
        LOG_WARN("Capture target closed");
    }

    MaterializedFrame last;
    CaptureStatus frame_status = controller.frame(last);
    uint64_t frames = controller.frames_delivered();

    controller.stop();

    printf("Captured %llu frames in %.2f s (%.1f fps)\n",
           static_cast<unsigned long long>(frames), elapsed,
           elapsed > 0.0 ? static_cast<double>(frames) / elapsed : 0.0);

    if (!config.output_path.empty()) {
        if (!succeeded(frame_status)) {
            fprintf(stderr, "No frame to write: %s\n", to_string(frame_status));
            return 1;
        }
        if (!write_pam(config.output_path, last, config.capture.pixel_format)) {
            return 1;
        }
        printf("Last frame %dx%d written to %s\n", last.width, last.height,
               config.output_path.c_str());
    }

    return 0;
}

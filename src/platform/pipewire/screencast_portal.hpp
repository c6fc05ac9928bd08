#pragma once

#include "../capture_platform.hpp"

#include <cstdint>
#include <string>

// Forward declarations to avoid including GLib headers
typedef struct _GDBusConnection GDBusConnection;
typedef struct _GDBusProxy GDBusProxy;

namespace pixel_forge {

// org.freedesktop.portal.ScreenCast source types
enum class PortalSourceType : uint32_t {
    MONITOR = 1,
    WINDOW = 2
};

// One ScreenCast session on xdg-desktop-portal. The user picks the source
// in the compositor's dialog; the session stays valid until close().
class ScreenCastPortal {
public:
    ScreenCastPortal();
    ~ScreenCastPortal();

    ScreenCastPortal(const ScreenCastPortal&) = delete;
    ScreenCastPortal& operator=(const ScreenCastPortal&) = delete;

    // CreateSession + SelectSources + Start. Blocks while the picker is shown.
    CaptureStatus open(PortalSourceType type);

    // New fd to the PipeWire remote restricted to this session. Caller owns it.
    int open_pipewire_remote();

    void close();

    bool is_open() const { return !m_session_handle.empty(); }
    uint32_t get_node_id() const { return m_node_id; }

    // Stream size reported by the portal, 0x0 if it didn't say
    SizeI get_stream_size() const { return m_stream_size; }

private:
    bool init_dbus();
    bool create_session();
    bool select_sources(PortalSourceType type);
    bool start_capture();

    // Fresh handle_token and the Request object path the portal will use for it
    std::string next_request_token(std::string& request_path);

    GDBusConnection* m_dbus_conn = nullptr;
    GDBusProxy* m_portal_proxy = nullptr;
    std::string m_sender_name;
    std::string m_session_handle;
    uint32_t m_request_counter = 0;

    uint32_t m_node_id = 0;
    SizeI m_stream_size;
};

}  // namespace pixel_forge

#include "screencast_portal.hpp"
#include "../../util/logger.hpp"

#include <gio/gio.h>
#include <gio/gunixfdlist.h>

#include <unistd.h>
#include <chrono>
#include <thread>

namespace pixel_forge {

// Portal D-Bus constants
static const char* PORTAL_BUS_NAME = "org.freedesktop.portal.Desktop";
static const char* PORTAL_OBJECT_PATH = "/org/freedesktop/portal/desktop";
static const char* SCREENCAST_INTERFACE = "org.freedesktop.portal.ScreenCast";
static const char* REQUEST_INTERFACE = "org.freedesktop.portal.Request";
static const char* SESSION_INTERFACE = "org.freedesktop.portal.Session";

static const int RESPONSE_TIMEOUT_MS = 30000;
// The source picker waits for the user
static const int SELECT_TIMEOUT_MS = 120000;

// cursor_mode: 1=hidden, 2=embedded, 4=metadata
static const uint32_t CURSOR_MODE_EMBEDDED = 2;

// Subscribes to the Response signal of one portal Request object. The
// subscription is made before the method call so a fast reply isn't lost.
class PortalRequest {
public:
    PortalRequest(GDBusConnection* conn, const std::string& request_path)
        : m_conn(conn) {
        subscribe(request_path);
    }

    ~PortalRequest() {
        unsubscribe();
        if (m_results) {
            g_variant_unref(m_results);
        }
    }

    PortalRequest(const PortalRequest&) = delete;
    PortalRequest& operator=(const PortalRequest&) = delete;

    // Older portals return a different Request path than the predicted one
    void follow(const std::string& request_path) {
        if (request_path == m_path) {
            return;
        }
        LOG_DEBUG("Portal request moved to %s", request_path.c_str());
        unsubscribe();
        subscribe(request_path);
    }

    // Results of a successful response (owned by the request), nullptr on
    // timeout, cancellation or failure
    GVariant* wait(const char* what, int timeout_ms) {
        GMainContext* context = g_main_context_default();
        auto start = std::chrono::steady_clock::now();
        while (!m_received) {
            g_main_context_iteration(context, FALSE);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            if (elapsed > timeout_ms) {
                LOG_ERROR("%s timed out after %d ms", what, timeout_ms);
                return nullptr;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (m_response != 0) {
            // 1 = cancelled by the user, 2 = other error
            LOG_ERROR("%s %s (response %u)", what,
                      m_response == 1 ? "was cancelled" : "failed", m_response);
            return nullptr;
        }
        return m_results;
    }

private:
    static void on_response(GDBusConnection*, const gchar*, const gchar*, const gchar*,
                            const gchar*, GVariant* parameters, gpointer user_data) {
        auto* self = static_cast<PortalRequest*>(user_data);
        GVariant* results = nullptr;
        g_variant_get(parameters, "(u@a{sv})", &self->m_response, &results);
        if (self->m_results) {
            g_variant_unref(self->m_results);
        }
        self->m_results = results;
        self->m_received = true;
    }

    void subscribe(const std::string& request_path) {
        m_path = request_path;
        m_signal_id = g_dbus_connection_signal_subscribe(
            m_conn,
            PORTAL_BUS_NAME,
            REQUEST_INTERFACE,
            "Response",
            m_path.c_str(),
            nullptr,
            G_DBUS_SIGNAL_FLAGS_NO_MATCH_RULE,
            on_response,
            this,
            nullptr
        );
    }

    void unsubscribe() {
        if (m_signal_id != 0) {
            g_dbus_connection_signal_unsubscribe(m_conn, m_signal_id);
            m_signal_id = 0;
        }
    }

    GDBusConnection* m_conn;
    std::string m_path;
    guint m_signal_id = 0;
    bool m_received = false;
    uint32_t m_response = 2;
    GVariant* m_results = nullptr;
};

ScreenCastPortal::ScreenCastPortal() = default;

ScreenCastPortal::~ScreenCastPortal() {
    close();
}

CaptureStatus ScreenCastPortal::open(PortalSourceType type) {
    LOG_INFO("Requesting screencast via xdg-desktop-portal...");

    if (!init_dbus()) {
        LOG_ERROR("Failed to initialize D-Bus connection");
        close();
        return CaptureStatus::PLATFORM_UNAVAILABLE;
    }

    if (!create_session()) {
        LOG_ERROR("Failed to create screencast session");
        close();
        return CaptureStatus::PLATFORM_INIT_FAILED;
    }

    if (!select_sources(type)) {
        LOG_ERROR("Failed to select sources");
        close();
        return CaptureStatus::TARGET_NOT_FOUND;
    }

    if (!start_capture()) {
        LOG_ERROR("Failed to start screencast");
        close();
        return CaptureStatus::TARGET_NOT_FOUND;
    }

    return CaptureStatus::OK;
}

bool ScreenCastPortal::init_dbus() {
    GError* error = nullptr;

    m_dbus_conn = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);
    if (!m_dbus_conn) {
        LOG_ERROR("Failed to connect to session bus: %s", error->message);
        g_error_free(error);
        return false;
    }

    m_portal_proxy = g_dbus_proxy_new_sync(
        m_dbus_conn,
        G_DBUS_PROXY_FLAGS_NONE,
        nullptr,
        PORTAL_BUS_NAME,
        PORTAL_OBJECT_PATH,
        SCREENCAST_INTERFACE,
        nullptr,
        &error
    );

    if (!m_portal_proxy) {
        LOG_ERROR("Failed to create portal proxy: %s", error->message);
        g_error_free(error);
        return false;
    }

    // ":1.42" -> "1_42", as used in Request and Session object paths
    m_sender_name = g_dbus_connection_get_unique_name(m_dbus_conn) + 1;
    for (char& c : m_sender_name) {
        if (c == '.') {
            c = '_';
        }
    }
    return true;
}

std::string ScreenCastPortal::next_request_token(std::string& request_path) {
    std::string token = "pixel_forge_" + std::to_string(getpid()) + "_" +
                        std::to_string(++m_request_counter);
    request_path = std::string(PORTAL_OBJECT_PATH) + "/request/" + m_sender_name + "/" + token;
    return token;
}

bool ScreenCastPortal::create_session() {
    GError* error = nullptr;

    std::string request_path;
    std::string token = next_request_token(request_path);
    PortalRequest request(m_dbus_conn, request_path);

    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&options, "{sv}", "handle_token",
                          g_variant_new_string(token.c_str()));
    g_variant_builder_add(&options, "{sv}", "session_handle_token",
                          g_variant_new_string(token.c_str()));

    GVariant* ret = g_dbus_proxy_call_sync(
        m_portal_proxy,
        "CreateSession",
        g_variant_new("(a{sv})", &options),
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        &error
    );

    if (!ret) {
        LOG_ERROR("CreateSession failed: %s", error->message);
        g_error_free(error);
        return false;
    }

    const char* returned_path = nullptr;
    g_variant_get(ret, "(&o)", &returned_path);
    request.follow(returned_path);
    g_variant_unref(ret);

    GVariant* response = request.wait("CreateSession", RESPONSE_TIMEOUT_MS);
    if (!response) {
        return false;
    }

    const char* session_handle = nullptr;
    if (g_variant_lookup(response, "session_handle", "&s", &session_handle)) {
        m_session_handle = session_handle;
        LOG_INFO("Created session: %s", m_session_handle.c_str());
    }

    return !m_session_handle.empty();
}

bool ScreenCastPortal::select_sources(PortalSourceType type) {
    GError* error = nullptr;

    std::string request_path;
    std::string token = next_request_token(request_path);
    PortalRequest request(m_dbus_conn, request_path);

    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&options, "{sv}", "handle_token",
                          g_variant_new_string(token.c_str()));
    g_variant_builder_add(&options, "{sv}", "types",
                          g_variant_new_uint32(static_cast<uint32_t>(type)));
    // One target per session
    g_variant_builder_add(&options, "{sv}", "multiple",
                          g_variant_new_boolean(FALSE));
    g_variant_builder_add(&options, "{sv}", "cursor_mode",
                          g_variant_new_uint32(CURSOR_MODE_EMBEDDED));

    GVariant* ret = g_dbus_proxy_call_sync(
        m_portal_proxy,
        "SelectSources",
        g_variant_new("(oa{sv})", m_session_handle.c_str(), &options),
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        &error
    );

    if (!ret) {
        LOG_ERROR("SelectSources failed: %s", error->message);
        g_error_free(error);
        return false;
    }

    const char* returned_path = nullptr;
    g_variant_get(ret, "(&o)", &returned_path);
    request.follow(returned_path);
    g_variant_unref(ret);

    if (!request.wait("SelectSources", SELECT_TIMEOUT_MS)) {
        return false;
    }

    LOG_INFO("Source selected (%s)", type == PortalSourceType::MONITOR ? "monitor" : "window");
    return true;
}

bool ScreenCastPortal::start_capture() {
    GError* error = nullptr;

    std::string request_path;
    std::string token = next_request_token(request_path);
    PortalRequest request(m_dbus_conn, request_path);

    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE("a{sv}"));
    g_variant_builder_add(&options, "{sv}", "handle_token",
                          g_variant_new_string(token.c_str()));

    GVariant* ret = g_dbus_proxy_call_sync(
        m_portal_proxy,
        "Start",
        g_variant_new("(osa{sv})", m_session_handle.c_str(), "", &options),
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        &error
    );

    if (!ret) {
        LOG_ERROR("Start failed: %s", error->message);
        g_error_free(error);
        return false;
    }

    const char* returned_path = nullptr;
    g_variant_get(ret, "(&o)", &returned_path);
    request.follow(returned_path);
    g_variant_unref(ret);

    GVariant* response = request.wait("Start", SELECT_TIMEOUT_MS);
    if (!response) {
        return false;
    }

    // Extract the PipeWire node of the (single) stream
    GVariant* streams = nullptr;
    if (g_variant_lookup(response, "streams", "@a(ua{sv})", &streams)) {
        GVariantIter iter;
        g_variant_iter_init(&iter, streams);

        uint32_t node_id = 0;
        GVariant* props = nullptr;
        if (g_variant_iter_next(&iter, "(u@a{sv})", &node_id, &props)) {
            m_node_id = node_id;

            int32_t width = 0;
            int32_t height = 0;
            if (g_variant_lookup(props, "size", "(ii)", &width, &height)) {
                m_stream_size = SizeI{width, height};
            }
            LOG_INFO("Got PipeWire node: %u (%dx%d)", node_id, width, height);
            g_variant_unref(props);
        }
        g_variant_unref(streams);
    }

    if (m_node_id == 0) {
        LOG_ERROR("Portal returned no stream");
        return false;
    }
    return true;
}

int ScreenCastPortal::open_pipewire_remote() {
    if (!is_open()) {
        return -1;
    }

    GError* error = nullptr;
    GUnixFDList* fd_list = nullptr;
    GVariantBuilder options;
    g_variant_builder_init(&options, G_VARIANT_TYPE("a{sv}"));

    GVariant* ret = g_dbus_proxy_call_with_unix_fd_list_sync(
        m_portal_proxy,
        "OpenPipeWireRemote",
        g_variant_new("(oa{sv})", m_session_handle.c_str(), &options),
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        &fd_list,
        nullptr,
        &error
    );

    if (!ret) {
        LOG_ERROR("OpenPipeWireRemote failed: %s", error->message);
        g_error_free(error);
        return -1;
    }

    int32_t fd_index = 0;
    g_variant_get(ret, "(h)", &fd_index);
    g_variant_unref(ret);

    int fd = -1;
    if (fd_list) {
        fd = g_unix_fd_list_get(fd_list, fd_index, &error);
        if (fd < 0) {
            LOG_ERROR("Failed to get PipeWire fd: %s", error->message);
            g_error_free(error);
        }
        g_object_unref(fd_list);
    }

    LOG_DEBUG("Got PipeWire fd: %d", fd);
    return fd;
}

void ScreenCastPortal::close() {
    if (!m_session_handle.empty() && m_dbus_conn) {
        GError* error = nullptr;
        GVariant* ret = g_dbus_connection_call_sync(
            m_dbus_conn,
            PORTAL_BUS_NAME,
            m_session_handle.c_str(),
            SESSION_INTERFACE,
            "Close",
            nullptr,
            nullptr,
            G_DBUS_CALL_FLAGS_NONE,
            -1,
            nullptr,
            &error
        );
        if (ret) {
            g_variant_unref(ret);
        } else {
            LOG_WARN("Failed to close portal session: %s", error->message);
            g_error_free(error);
        }
    }
    m_session_handle.clear();
    m_node_id = 0;

    if (m_portal_proxy) {
        g_object_unref(m_portal_proxy);
        m_portal_proxy = nullptr;
    }
    if (m_dbus_conn) {
        g_object_unref(m_dbus_conn);
        m_dbus_conn = nullptr;
    }
}

}  // namespace pixel_forge

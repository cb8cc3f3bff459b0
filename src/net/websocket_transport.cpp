/**
 * @file websocket_transport.cpp
 * @brief WebSocket client transport implementation using libwebsockets
 */

#include "nightfall/net/websocket_transport.h"
#include "nightfall/core/logging.h"
#include "nightfall/net/wire.h"
#include <libwebsockets.h>
#include <charconv>
#include <cstring>
#include <vector>

namespace nightfall::net {

// ============================================================================
// URL Helpers
// ============================================================================

bool parse_websocket_url(const std::string& url, WebSocketEndpoint& out_endpoint) {
    WebSocketEndpoint endpoint;
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.secure = true;
        endpoint.port = 443;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        rest = url.substr(5);
    } else {
        return false;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.path = rest.substr(slash);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port_text = authority.substr(colon + 1);
        int port = 0;
        auto result = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (result.ec != std::errc() || result.ptr != port_text.data() + port_text.size() ||
            port <= 0 || port > 65535) {
            return false;
        }
        endpoint.port = port;
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return false;
    }
    endpoint.host = authority;
    out_endpoint = endpoint;
    return true;
}

std::string append_credential(const std::string& path, const std::string& credential) {
    if (credential.empty()) {
        return path;
    }

    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : credential) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    char separator = path.find('?') == std::string::npos ? '?' : '&';
    return path + separator + "token=" + encoded;
}

// ============================================================================
// Callbacks
// ============================================================================

struct WebSocketCallbacks {
    static int callback(lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len) {
        (void)user;
        lws_context* context = lws_get_context(wsi);
        auto* self = context ? static_cast<WebSocketTransport*>(lws_context_user(context)) : nullptr;
        if (!self) return 0;

        switch (reason) {
            case LWS_CALLBACK_CLIENT_ESTABLISHED: {
                self->open_ = true;
                self->close_reason_.clear();
                log::logger()->info("websocket: connected");
                if (self->notify_ && self->listener_) {
                    self->listener_->on_open();
                }
                if (!self->outbox_.empty()) {
                    lws_callback_on_writable(wsi);
                }
                break;
            }

            case LWS_CALLBACK_CLIENT_RECEIVE: {
                self->rx_buffer_.append(static_cast<const char*>(in), len);
                if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
                    std::string frame;
                    frame.swap(self->rx_buffer_);
                    log::logger()->trace("websocket: <- {}", frame);
                    if (self->notify_ && self->listener_) {
                        self->listener_->on_message(frame);
                    }
                }
                break;
            }

            case LWS_CALLBACK_CLIENT_WRITEABLE: {
                if (self->outbox_.empty()) break;

                std::string message = std::move(self->outbox_.front());
                self->outbox_.pop_front();

                // LWS requires pre-padding
                std::vector<unsigned char> buf(LWS_PRE + message.size());
                std::memcpy(buf.data() + LWS_PRE, message.data(), message.size());
                int written = lws_write(wsi, buf.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
                if (written < static_cast<int>(message.size())) {
                    log::logger()->warn("websocket: short write ({} of {} bytes)", written, message.size());
                    return -1;
                }
                log::logger()->trace("websocket: -> {}", message);

                if (!self->outbox_.empty()) {
                    lws_callback_on_writable(wsi);
                }
                break;
            }

            case LWS_CALLBACK_WS_PEER_INITIATED_CLOSE: {
                int code = 0;
                if (in && len >= 2) {
                    const auto* bytes = static_cast<const unsigned char*>(in);
                    code = (bytes[0] << 8) | bytes[1];
                }
                self->close_reason_ = code == LWS_CLOSE_STATUS_NORMAL
                    ? wire::REASON_SERVER_DISCONNECT
                    : wire::REASON_TRANSPORT_CLOSE;
                log::logger()->info("websocket: server closed with status {}", code);
                break;
            }

            case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
                std::string error = in ? std::string(static_cast<const char*>(in), len) : "connection error";
                bool was_open = self->open_;
                self->open_ = false;
                self->wsi_ = nullptr;
                self->outbox_.clear();
                log::logger()->warn("websocket: {}", error);
                if (self->notify_ && self->listener_) {
                    if (was_open) {
                        self->listener_->on_close(wire::REASON_TRANSPORT_ERROR);
                    } else {
                        self->listener_->on_error(error);
                    }
                }
                break;
            }

            case LWS_CALLBACK_CLIENT_CLOSED: {
                bool was_open = self->open_;
                self->open_ = false;
                self->wsi_ = nullptr;
                self->outbox_.clear();
                self->rx_buffer_.clear();
                std::string close_reason = self->close_reason_.empty()
                    ? std::string(wire::REASON_TRANSPORT_CLOSE)
                    : self->close_reason_;
                if (self->notify_ && self->listener_ && was_open) {
                    self->listener_->on_close(close_reason);
                }
                break;
            }

            default:
                break;
        }

        return 0;
    }
};

namespace {

lws_protocols protocols[] = {
    {
        "nightfall-protocol",
        WebSocketCallbacks::callback,
        0,
        65536,
        0, nullptr, 0
    },
    { nullptr, nullptr, 0, 0, 0, nullptr, 0 }  // terminator
};

} // anonymous namespace

// ============================================================================
// WebSocketTransport
// ============================================================================

WebSocketTransport::WebSocketTransport() = default;

WebSocketTransport::~WebSocketTransport() {
    notify_ = false;
    release_context();
}

void WebSocketTransport::set_listener(ITransportListener* listener) {
    listener_ = listener;
}

TransportResult WebSocketTransport::open(const std::string& url, const std::string& credential) {
    if (open_ || wsi_) {
        return TransportResult::AlreadyOpen;
    }

    WebSocketEndpoint endpoint;
    if (!parse_websocket_url(url, endpoint)) {
        return TransportResult::InvalidUrl;
    }

    // A context left over from a dropped socket is replaced
    if (context_ && !in_service_) {
        release_context();
    }
    if (context_) {
        return TransportResult::AlreadyOpen;
    }

    lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.user = this;
    if (endpoint.secure) {
        info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    }

    context_ = lws_create_context(&info);
    if (!context_) {
        return TransportResult::ContextCreationFailed;
    }

    std::string path = append_credential(endpoint.path, credential);

    lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = context_;
    ccinfo.address = endpoint.host.c_str();
    ccinfo.port = endpoint.port;
    ccinfo.path = path.c_str();
    ccinfo.host = endpoint.host.c_str();
    ccinfo.origin = endpoint.host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = endpoint.secure ? LCCSCF_USE_SSL : 0;
    ccinfo.pwsi = &wsi_;

    notify_ = true;
    close_reason_.clear();
    if (!lws_client_connect_via_info(&ccinfo)) {
        wsi_ = nullptr;
        release_context();
        return TransportResult::ConnectFailed;
    }

    log::logger()->debug("websocket: connecting to {}:{}{}", endpoint.host, endpoint.port, endpoint.path);
    return TransportResult::Success;
}

void WebSocketTransport::close() {
    notify_ = false;
    open_ = false;
    outbox_.clear();
    if (in_service_) {
        // Destroying the context from inside its own callback is not allowed
        destroy_pending_ = true;
        return;
    }
    release_context();
}

TransportResult WebSocketTransport::send(const std::string& frame) {
    if (!open_ || !wsi_) {
        return TransportResult::NotOpen;
    }
    outbox_.push_back(frame);
    lws_callback_on_writable(wsi_);
    return TransportResult::Success;
}

bool WebSocketTransport::is_open() const {
    return open_;
}

void WebSocketTransport::poll() {
    if (!context_) return;

    in_service_ = true;
    lws_service(context_, 0);  // Non-blocking
    in_service_ = false;

    if (destroy_pending_) {
        release_context();
    }
}

void WebSocketTransport::release_context() {
    destroy_pending_ = false;
    if (context_) {
        lws_context_destroy(context_);
        context_ = nullptr;
    }
    wsi_ = nullptr;
    open_ = false;
    rx_buffer_.clear();
}

} // namespace nightfall::net

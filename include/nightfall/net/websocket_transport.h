#pragma once
/**
 * @file websocket_transport.h
 * @brief WebSocket client transport using libwebsockets
 *
 * The socket is serviced by poll(), which must be called from the control
 * thread; listener callbacks therefore arrive on that thread as well.
 * A normal close frame from the server (status 1000) is reported as an
 * intentional server disconnect, anything else as a transport close.
 */

#include "nightfall/net/transport.h"
#include <deque>
#include <string>

struct lws;
struct lws_context;

namespace nightfall::net {

/**
 * @brief Parsed ws:// or wss:// endpoint
 */
struct WebSocketEndpoint {
    bool secure{false};
    std::string host;
    int port{80};
    std::string path{"/"};
};

/**
 * @brief Split a ws/wss URL into its parts
 * @return false if the scheme or host is missing
 */
bool parse_websocket_url(const std::string& url, WebSocketEndpoint& out_endpoint);

/**
 * @brief Append the session credential as a token query parameter
 */
std::string append_credential(const std::string& path, const std::string& credential);

class WebSocketTransport : public ITransport {
public:
    WebSocketTransport();
    ~WebSocketTransport() override;

    // Non-copyable, non-movable (the context keeps a pointer to this)
    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void set_listener(ITransportListener* listener) override;
    TransportResult open(const std::string& url, const std::string& credential) override;
    void close() override;
    TransportResult send(const std::string& frame) override;
    bool is_open() const override;
    void poll() override;

    SizeT outbox_size() const { return outbox_.size(); }

private:
    friend struct WebSocketCallbacks;

    void release_context();

    ITransportListener* listener_{nullptr};
    lws_context* context_{nullptr};
    lws* wsi_{nullptr};

    bool open_{false};
    bool notify_{true};           ///< Cleared by close() so teardown stays silent
    bool in_service_{false};
    bool destroy_pending_{false};

    std::string rx_buffer_;
    std::deque<std::string> outbox_;
    std::string close_reason_;
};

} // namespace nightfall::net

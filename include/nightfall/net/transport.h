#pragma once
/**
 * @file transport.h
 * @brief Socket transport abstraction
 *
 * The connection manager talks to the network only through ITransport.
 * Listener callbacks must arrive on the control thread; transports that
 * service the socket elsewhere hand events over with IScheduler::post().
 */

#include "nightfall/core/types.h"
#include <string>

namespace nightfall::net {

// ============================================================================
// Transport Result Enum
// ============================================================================

enum class TransportResult : UInt8 {
    Success = 0,
    InvalidUrl,
    AlreadyOpen,
    NotOpen,
    ContextCreationFailed,
    ConnectFailed,
    SendFailed
};

inline const char* transport_result_to_string(TransportResult result) {
    switch (result) {
        case TransportResult::Success: return "Success";
        case TransportResult::InvalidUrl: return "InvalidUrl";
        case TransportResult::AlreadyOpen: return "AlreadyOpen";
        case TransportResult::NotOpen: return "NotOpen";
        case TransportResult::ContextCreationFailed: return "ContextCreationFailed";
        case TransportResult::ConnectFailed: return "ConnectFailed";
        case TransportResult::SendFailed: return "SendFailed";
        default: return "Unknown";
    }
}

// ============================================================================
// Listener Interface
// ============================================================================

class ITransportListener {
public:
    virtual ~ITransportListener() = default;

    /// Socket handshake completed
    virtual void on_open() {}

    /// Socket closed after being open; reason uses the wire close reasons
    virtual void on_close(const std::string& reason) { (void)reason; }

    /// Socket could not be opened
    virtual void on_error(const std::string& error) { (void)error; }

    /// One complete text frame
    virtual void on_message(const std::string& frame) { (void)frame; }
};

// ============================================================================
// Transport Interface
// ============================================================================

class ITransport {
public:
    virtual ~ITransport() = default;

    virtual void set_listener(ITransportListener* listener) = 0;

    /**
     * @brief Start opening the socket; completion is reported to the listener
     */
    virtual TransportResult open(const std::string& url, const std::string& credential) = 0;

    /**
     * @brief Close the socket without reporting on_close
     */
    virtual void close() = 0;

    virtual TransportResult send(const std::string& frame) = 0;

    virtual bool is_open() const = 0;

    /**
     * @brief Service the socket from the control thread
     */
    virtual void poll() {}
};

} // namespace nightfall::net

#pragma once

#include "core/constants.h"
#include "live_transport.h"
#include <cstddef>
#include <memory>
#include <string>

namespace lumiere {

/**
 * @brief Settings for the hosted live service connection
 */
struct LiveEndpointConfig {
    std::string endpoint;       ///< wss:// URL of the bidirectional streaming method
    std::string api_key;
    int connect_timeout_ms = 10000;   ///< Bounds connect, upgrade and setupComplete together
    size_t max_message_bytes = constants::protocol::MAX_MESSAGE_BYTES;
};

/**
 * @brief LiveTransport over a secure WebSocket using libcurl
 *
 * Handshake: WebSocket upgrade, then a setup message; the session is open
 * once the service answers setupComplete. All curl calls on the handle are
 * serialized by an internal mutex; receive() waits on the socket outside it
 * so sends are never blocked behind an idle receive.
 */
class GeminiLiveTransport : public LiveTransport {
public:
    explicit GeminiLiveTransport(const LiveEndpointConfig& config);
    ~GeminiLiveTransport() override;

    GeminiLiveTransport(const GeminiLiveTransport&) = delete;
    GeminiLiveTransport& operator=(const GeminiLiveTransport&) = delete;

    VoidResult connect(const SessionConfig& config) override;
    VoidResult send_audio(const std::string& payload, int sample_rate) override;
    VoidResult send_tool_response(const ToolResponse& response) override;
    Result<ServerEvent> receive(int timeout_ms) override;
    VoidResult close(int timeout_ms) override;
    bool is_remote_closed() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lumiere

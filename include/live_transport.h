#pragma once

#include "core/types.h"
#include "errors.h"
#include <string>

namespace lumiere {

/**
 * @brief Duplex channel to the remote conversational agent
 *
 * Owned exclusively by LiveSession. Implementations must allow send_*() and
 * receive() to run concurrently on different threads, and close() to be
 * called while either is in flight.
 */
class LiveTransport {
public:
    virtual ~LiveTransport() = default;

    /**
     * @brief Open the channel and complete the session handshake (blocking)
     * @return ConnectionError on any handshake failure
     */
    virtual VoidResult connect(const SessionConfig& config) = 0;

    /**
     * @brief Send one encoded audio frame
     * @param payload base64 int16 LE PCM
     * @param sample_rate Rate of the payload
     */
    virtual VoidResult send_audio(const std::string& payload, int sample_rate) = 0;

    /**
     * @brief Send a tool-call acknowledgment
     */
    virtual VoidResult send_tool_response(const ToolResponse& response) = 0;

    /**
     * @brief Wait up to timeout_ms for the next server event
     * @return Event; Timeout when nothing arrived; CodecError for a malformed
     *         message (session continues); ConnectionError when the channel is gone
     */
    virtual Result<ServerEvent> receive(int timeout_ms) = 0;

    /**
     * @brief Request termination and wait at most timeout_ms for the remote
     *
     * Local resources are released regardless of the remote's answer.
     * Idempotent.
     */
    virtual VoidResult close(int timeout_ms) = 0;

    /// True once the remote side ended the channel
    virtual bool is_remote_closed() const = 0;
};

} // namespace lumiere

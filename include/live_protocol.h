#pragma once

/**
 * @file live_protocol.h
 * @brief JSON message builders and parser for the live service
 *
 * Only the message-kind contract used by the session is covered: setup,
 * realtime audio input, tool responses out; setup-complete, server content
 * (transcriptions, model audio, turn-complete), tool calls, go-away and
 * errors in.
 */

#include "core/types.h"
#include "errors.h"
#include <cstddef>
#include <string>

namespace lumiere {
namespace protocol {

/// First message on the channel
std::string build_setup_message(const SessionConfig& config);

/// One realtime audio chunk
std::string build_audio_message(const std::string& payload, int sample_rate);

/// Function-call acknowledgment
std::string build_tool_response_message(const ToolResponse& response);

/**
 * @brief Parse one inbound message
 * @return Event (possibly with no payload for unknown message kinds), or
 *         CodecError for malformed JSON
 */
Result<ServerEvent> parse_server_message(const std::string& text);

/// Normalized model resource name ("models/<id>")
std::string model_resource(const std::string& model);

/// WebSocket close codes that mean an orderly end of session
bool is_normal_close(int code);

/**
 * @brief Inbound message standing in for a WebSocket close frame
 *
 * Lets a close flow through parse_server_message like any other message.
 * A non-normal code also carries an error so the session fails. Bytes in the
 * reason that are not valid UTF-8 are replaced.
 */
std::string build_session_closed_message(int code, const std::string& reason);

/**
 * @brief Reassembles one inbound message from WebSocket receive chunks
 *
 * A message ends with the chunk that has no bytes left in its frame and no
 * continuation fragment after it. A message that grows past the size limit is
 * reported once as TooLarge and the rest of it is discarded.
 */
class MessageAssembler {
public:
    enum class Status { Incomplete, Complete, TooLarge };

    explicit MessageAssembler(size_t max_bytes);

    Status feed(const char* data, size_t len, bool final_chunk);

    /// The completed message; leaves the assembler empty
    std::string take();

    void reset();

private:
    size_t max_bytes_;
    std::string buffer_;
    bool discarding_ = false;
};

} // namespace protocol
} // namespace lumiere

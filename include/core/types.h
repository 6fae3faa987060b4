#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the Lumiere live voice client
 *
 * Audio buffers, session configuration and the message-kind contract shared
 * between the live session, the transport and the tool dispatcher.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <functional>
#include <optional>

namespace lumiere {

// =============================================================================
// Audio Types
// =============================================================================

/// 16-bit signed PCM sample (wire format in both directions)
using Sample = int16_t;

/// Captured microphone frame, float samples in [-1, 1]
using AudioFrame = std::vector<float>;

/// Raw PCM buffer
using PcmBuffer = std::vector<Sample>;

/**
 * @brief Decoded audio ready for the output device
 */
struct PlaybackBuffer {
    std::vector<float> samples;
    int sample_rate = 0;

    /// Duration in seconds on the output clock
    double duration() const {
        if (sample_rate <= 0) return 0.0;
        return static_cast<double>(samples.size()) / static_cast<double>(sample_rate);
    }

    bool empty() const { return samples.empty(); }
};

// =============================================================================
// Session Types
// =============================================================================

/**
 * @brief Immutable per-session input, built once per open()
 */
struct SessionConfig {
    std::string model;
    std::string voice_name;
    std::string system_instruction;
    std::string tools_json;         ///< Capability manifest: JSON array of function declarations
    int input_sample_rate = 16000;
    int output_sample_rate = 24000;
    int frame_size = 4096;
};

/// Product card pushed by the agent
struct Product {
    std::string id;
    std::string brand;
    std::string name;
    std::string price;
    std::string description;
    std::optional<std::string> category;
    std::optional<std::string> currency;
};

/// Function call requested by the remote agent
struct ToolCall {
    std::string id;
    std::string name;
    std::string args_json;
};

/// Acknowledgment for a tool call, paired by id
struct ToolResponse {
    std::string id;
    std::string name;
    std::string result;
};

/**
 * @brief One inbound server message
 *
 * A single message may carry several payload kinds at once; the session runs
 * every applicable handler.
 */
struct ServerEvent {
    std::optional<std::string> input_transcription;   ///< User speech delta
    std::optional<std::string> output_transcription;  ///< Agent speech delta
    bool turn_complete = false;
    std::vector<std::string> audio_chunks;            ///< base64 PCM payloads, in order
    std::vector<ToolCall> tool_calls;
    bool setup_complete = false;
    bool session_closed = false;                      ///< Remote ended the session
    std::optional<std::string> session_error;         ///< Remote reported a fatal error
    std::string close_reason;

    bool has_payload() const {
        return input_transcription || output_transcription || turn_complete ||
               !audio_chunks.empty() || !tool_calls.empty() || setup_complete ||
               session_closed || session_error;
    }
};

// =============================================================================
// Callback Types
// =============================================================================

/// Captured frame callback (runs on the audio device thread)
using AudioFrameCallback = std::function<void(const AudioFrame&)>;

/// Transcript update: full accumulated text and whether the utterance is final
using TranscriptCallback = std::function<void(const std::string&, bool)>;

/// Products found callback
using ProductsCallback = std::function<void(const std::vector<Product>&)>;

} // namespace lumiere

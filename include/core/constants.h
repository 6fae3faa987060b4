#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Wire-adjacent values are fixed by contract with the live service and must
 * not be changed without a matching service-side change.
 */

#include <cstddef>

namespace lumiere {
namespace constants {

// =============================================================================
// Audio Contract
// =============================================================================

namespace audio {
    /// Microphone sample rate sent to the service (Hz)
    constexpr int INPUT_SAMPLE_RATE = 16000;

    /// Synthesized speech sample rate received from the service (Hz)
    constexpr int OUTPUT_SAMPLE_RATE = 24000;

    /// Samples per captured frame
    constexpr int CAPTURE_FRAME_SIZE = 4096;

    /// Float to int16 scale factor
    constexpr float PCM_SCALE = 32768.0f;

    /// Samples per output device callback
    constexpr int OUTPUT_FRAMES_PER_BUFFER = 512;
}

// =============================================================================
// Session
// =============================================================================

namespace session {
    /// Bounded wait for the remote to acknowledge termination (ms)
    constexpr int CLOSE_TIMEOUT_MS = 2000;

    /// Handshake timeout (ms)
    constexpr int CONNECT_TIMEOUT_MS = 10000;

    /// Outbound frames held while the transport is busy; oldest dropped beyond this
    constexpr size_t OUTBOUND_QUEUE_DEPTH = 8;

    /// Receive poll interval, bounds how long the receiver takes to notice teardown (ms)
    constexpr int RECEIVE_POLL_MS = 100;
}

// =============================================================================
// Live Protocol
// =============================================================================

namespace protocol {
    constexpr const char* DEFAULT_ENDPOINT =
        "wss://generativelanguage.googleapis.com/ws/"
        "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    constexpr const char* DEFAULT_MODEL = "gemini-2.5-flash-native-audio-preview-09-2025";
    constexpr const char* DEFAULT_VOICE = "Kore";
    constexpr const char* TOOL_ACK_RESULT = "Products displayed to user.";

    /// Largest single inbound message accepted (bytes)
    constexpr size_t MAX_MESSAGE_BYTES = 16 * 1024 * 1024;
}

// =============================================================================
// Tools
// =============================================================================

namespace tools {
    constexpr const char* DISPLAY_PRODUCTS = "displayProducts";
}

} // namespace constants
} // namespace lumiere

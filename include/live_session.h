#pragma once

#include "audio_bridge.h"
#include "core/constants.h"
#include "core/types.h"
#include "live_transport.h"
#include "session_host.h"
#include <cstdint>
#include <functional>
#include <memory>

namespace lumiere {

/**
 * @brief Live session lifecycle state
 */
enum class SessionState {
    Idle,        ///< Never opened
    Connecting,  ///< Acquiring capture and completing the handshake
    Open,        ///< Streaming both ways
    Closing,     ///< Teardown in progress; all continuations are no-ops
    Closed,      ///< Ended by request or by the remote
    Failed       ///< Ended by a device or connection failure
};

const char* session_state_name(SessionState state);

/// Builds a fresh transport for each open()
using TransportFactory = std::function<std::unique_ptr<LiveTransport>()>;

/**
 * @brief Tuning knobs that are not part of the service contract
 */
struct SessionOptions {
    int close_timeout_ms = constants::session::CLOSE_TIMEOUT_MS;
    size_t outbound_queue_depth = constants::session::OUTBOUND_QUEUE_DEPTH;
    int receive_poll_ms = constants::session::RECEIVE_POLL_MS;
};

/**
 * @brief Counters for diagnostics
 */
struct SessionStats {
    uint64_t frames_captured = 0;   ///< Frames accepted for sending
    uint64_t frames_sent = 0;
    uint64_t frames_dropped = 0;    ///< Evicted from a full outbound queue
    uint64_t buffers_scheduled = 0;
    uint64_t codec_errors = 0;
    uint64_t tool_calls_acknowledged = 0;
};

/**
 * @brief Live voice session manager
 *
 * Opens the duplex channel, streams microphone frames out, schedules inbound
 * speech for gapless playback, reconciles transcripts and answers tool calls.
 *
 * Lifecycle:
 * - Idle/Closed/Failed -> Connecting (open)
 * - Connecting -> Open (capture acquired and handshake complete)
 * - Connecting -> Failed (either failed; acquired resources released)
 * - Open -> Closing -> Closed (close(), remote close, owner teardown)
 * - Open -> Closing -> Failed (transport failure)
 *
 * Teardown order: terminate the remote channel, stop capture and playback,
 * release the devices, clear transcripts and the playback watermark, then
 * notify the host exactly once.
 *
 * Thread Safety:
 * - Capture frames arrive on the audio device thread
 * - A sender thread encodes and sends frames in capture order
 * - A receiver thread routes inbound events in receipt order
 * - All shared state is guarded by one mutex; every continuation checks the
 *   session is still Open (same generation) before touching it
 * - Outbound backpressure: when the queue is full the oldest unsent frame is
 *   dropped (most recent frame wins)
 */
class LiveSession {
public:
    LiveSession(std::unique_ptr<AudioBridge> bridge,
                TransportFactory transport_factory,
                SessionCallbacks callbacks,
                SessionOptions options = SessionOptions());

    /// Owner teardown: closes an active session and joins all workers
    ~LiveSession();

    LiveSession(const LiveSession&) = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    /**
     * @brief Start opening a session (returns immediately)
     *
     * Failure is reported through on_closed.
     * @return false if a session is already connecting, open or closing
     */
    bool open(const SessionConfig& config);

    /**
     * @brief End the session; idempotent, safe from host callbacks
     *
     * Returns once teardown has completed (bounded by the close timeout when
     * the remote does not acknowledge).
     */
    void close();

    /**
     * @brief Suppress outbound audio; the capture device stays open
     */
    void set_muted(bool muted);
    bool is_muted() const;

    SessionState state() const;

    /**
     * @brief Block until the session is Open or has ended
     * @return true if Open
     */
    bool wait_until_open(int timeout_ms) const;

    /**
     * @brief Block until the session reaches Closed or Failed
     * @return true if it ended within the timeout
     */
    bool wait_until_ended(int timeout_ms) const;

    /// Earliest output-clock time the next playback buffer may start
    double playback_watermark() const;

    SessionStats stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lumiere

#pragma once

#include "core/types.h"
#include <functional>
#include <string>

namespace lumiere {

/**
 * @brief Why a live session ended
 *
 * Only DeviceUnavailable and ConnectionError are failures; the host shows the
 * same "session ended" state for all of them.
 */
enum class CloseReason {
    Requested,          ///< close() or owner teardown
    RemoteClosed,       ///< The service ended the session cleanly
    DeviceUnavailable,  ///< Microphone or speaker could not be acquired
    ConnectionError     ///< Handshake or transport failure
};

inline const char* close_reason_name(CloseReason reason) {
    switch (reason) {
        case CloseReason::Requested: return "Requested";
        case CloseReason::RemoteClosed: return "RemoteClosed";
        case CloseReason::DeviceUnavailable: return "DeviceUnavailable";
        case CloseReason::ConnectionError: return "ConnectionError";
        default: return "Unknown";
    }
}

/**
 * @brief Host-supplied callbacks
 *
 * Invoked from session worker threads, never while the session holds its
 * internal lock, so a callback may call back into the session (including
 * close()). Any callback may be left empty.
 */
struct SessionCallbacks {
    ProductsCallback on_products_found;
    TranscriptCallback on_user_transcript;
    TranscriptCallback on_agent_transcript;
    /// Fires exactly once per opened session
    std::function<void(CloseReason, const std::string&)> on_closed;
};

} // namespace lumiere

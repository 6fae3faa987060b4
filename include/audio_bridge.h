#pragma once

#include "core/types.h"
#include "errors.h"

namespace lumiere {

/**
 * @brief Platform capture/playback devices behind one seam
 *
 * Capture is push-driven: the device thread hands each frame to the callback
 * and the bridge never blocks its caller. Playback is time-scheduled on the
 * output device clock; the caller picks start times (see PlaybackScheduler)
 * and the bridge renders buffers back-to-back in start order, never
 * overlapping and never dropping them.
 *
 * The bridge owns the devices exclusively. stop() releases everything and is
 * safe to call repeatedly, including when nothing was started.
 */
class AudioBridge {
public:
    virtual ~AudioBridge() = default;

    /**
     * @brief Acquire the capture device and start delivering frames
     * @param sample_rate Capture rate in Hz
     * @param frame_size Samples per delivered frame
     * @param on_frame Called from the device thread with exactly frame_size samples
     * @return DeviceUnavailable if no input device can be opened or started
     */
    virtual VoidResult start_capture(int sample_rate, int frame_size, AudioFrameCallback on_frame) = 0;

    /**
     * @brief Acquire the output device
     * @param sample_rate Playback rate in Hz
     * @return DeviceUnavailable if the output device can't be opened or started
     */
    virtual VoidResult start_playback(int sample_rate) = 0;

    /**
     * @brief Current time on the output clock, in seconds since playback started
     */
    virtual double output_time() const = 0;

    /**
     * @brief Enqueue a decoded buffer to start at start_time on the output clock
     * @return InvalidState if playback isn't running
     */
    virtual VoidResult schedule_playback(const PlaybackBuffer& buffer, double start_time) = 0;

    /**
     * @brief Stop capture and playback, release both devices, drop pending buffers
     * @return TeardownError if a device failed to close cleanly (release still completes)
     */
    virtual VoidResult stop() = 0;
};

} // namespace lumiere

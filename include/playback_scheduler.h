#pragma once

namespace lumiere {

/**
 * @brief Gapless, non-overlapping start times for playback buffers
 *
 * Keeps the watermark: the earliest output-clock time the next buffer may
 * start. A late buffer starts "now" (the gap is silence); an early one queues
 * back-to-back behind the previous buffer.
 */
class PlaybackScheduler {
public:
    /**
     * @brief Reserve a slot for a buffer
     * @param now Current output clock (seconds)
     * @param duration Buffer duration (seconds)
     * @return Start time, max(now, watermark); the watermark advances to start + duration
     */
    double schedule(double now, double duration);

    /// Earliest start time for the next buffer
    double watermark() const { return watermark_; }

    /// Back to zero (session teardown)
    void reset() { watermark_ = 0.0; }

private:
    double watermark_ = 0.0;
};

} // namespace lumiere

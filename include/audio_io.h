#pragma once

#include "audio_bridge.h"
#include <string>
#include <memory>

namespace lumiere {

/**
 * @brief AudioBridge backed by PortAudio
 *
 * Opens a mono float32 input stream for capture and a separate mono float32
 * output stream for playback. The output stream callback advances the output
 * clock and renders scheduled buffers; silence fills any gap.
 *
 * Thread Safety:
 * - Capture callback runs in PortAudio's input thread
 * - Playback callback runs in PortAudio's output thread
 * - schedule_playback() and output_time() are safe from any thread
 * - stop() must not be called from inside the frame callback
 */
class AudioIO : public AudioBridge {
public:
    /**
     * @param input_device Device name, numeric index, or "default"
     * @param output_device Device name, numeric index, or "default"
     */
    AudioIO(const std::string& input_device, const std::string& output_device);
    ~AudioIO() override;

    // Non-copyable
    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    VoidResult start_capture(int sample_rate, int frame_size, AudioFrameCallback on_frame) override;
    VoidResult start_playback(int sample_rate) override;
    double output_time() const override;
    VoidResult schedule_playback(const PlaybackBuffer& buffer, double start_time) override;
    VoidResult stop() override;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace lumiere

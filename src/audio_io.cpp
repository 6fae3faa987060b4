#include "audio_io.h"
#include "core/constants.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>
#include <cmath>
#include <cstring>
#include <sstream>

namespace lumiere {

class AudioIO::Impl {
public:
    Impl(const std::string& input_device, const std::string& output_device)
        : input_device_(input_device), output_device_(output_device),
          input_stream_(nullptr), output_stream_(nullptr),
          pa_refs_(0), frame_size_(0), output_rate_(0), frames_rendered_(0) {}

    ~Impl() {
        stop();
    }

    VoidResult start_capture(int sample_rate, int frame_size, AudioFrameCallback on_frame) {
        if (input_stream_) {
            return make_error(ErrorType::InvalidState, "capture already running");
        }
        if (frame_size <= 0 || sample_rate <= 0) {
            return make_device_error("invalid capture format");
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        pa_refs_++;

        int input_idx = find_device(input_device_, true);
        if (input_idx < 0) {
            return make_device_error("Input device not found: " + input_device_);
        }
        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        if (!input_info || input_info->maxInputChannels == 0) {
            return make_device_error("Device '" + input_device_ + "' has no input channels");
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name;
        Logger::info(dev_oss.str());

        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            on_frame_ = std::move(on_frame);
            frame_size_ = static_cast<size_t>(frame_size);
            pending_.clear();
            pending_.reserve(frame_size_);
        }

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paFloat32;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, sample_rate,
                           static_cast<unsigned long>(frame_size), paClipOff, capture_callback, this);
        if (err != paNoError) {
            input_stream_ = nullptr;
            return make_device_error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            if (err == paUnanticipatedHostError) {
                err_oss << "; microphone permission may be denied";
            }
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
            return make_device_error(err_oss.str());
        }

        LOG_AUDIO("capture started at " + std::to_string(sample_rate) + " Hz, " +
                  std::to_string(frame_size) + " samples/frame");
        return VoidResult();
    }

    VoidResult start_playback(int sample_rate) {
        if (output_stream_) {
            return make_error(ErrorType::InvalidState, "playback already running");
        }
        if (sample_rate <= 0) {
            return make_device_error("invalid playback rate");
        }

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            return make_device_error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
        }
        pa_refs_++;

        int output_idx = find_device(output_device_, false);
        if (output_idx < 0) {
            return make_device_error("Output device not found: " + output_device_);
        }
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        if (!output_info || output_info->maxOutputChannels == 0) {
            return make_device_error("Device '" + output_device_ + "' has no output channels");
        }

        std::ostringstream dev_oss;
        dev_oss << "Using output device: [" << output_idx << "] " << output_info->name;
        Logger::info(dev_oss.str());

        {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            scheduled_.clear();
            output_rate_ = sample_rate;
        }
        frames_rendered_ = 0;

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paFloat32;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, sample_rate,
                           constants::audio::OUTPUT_FRAMES_PER_BUFFER, paClipOff, playback_callback, this);
        if (err != paNoError) {
            output_stream_ = nullptr;
            return make_device_error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }

        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
            return make_device_error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }

        LOG_AUDIO("playback started at " + std::to_string(sample_rate) + " Hz");
        return VoidResult();
    }

    double output_time() const {
        int rate = output_rate_.load();
        if (rate <= 0) return 0.0;
        return static_cast<double>(frames_rendered_.load()) / static_cast<double>(rate);
    }

    VoidResult schedule_playback(const PlaybackBuffer& buffer, double start_time) {
        if (!output_stream_) {
            return make_error(ErrorType::InvalidState, "playback not running");
        }
        if (buffer.empty()) {
            return VoidResult();
        }

        std::lock_guard<std::mutex> lock(playback_mutex_);
        Scheduled item;
        item.start_frame = static_cast<uint64_t>(std::llround(std::max(start_time, 0.0) * output_rate_.load()));
        item.samples = buffer.samples;
        item.offset = 0;
        scheduled_.push_back(std::move(item));
        return VoidResult();
    }

    VoidResult stop() {
        Error teardown_error;

        if (input_stream_) {
            PaError err = Pa_StopStream(input_stream_);
            if (err != paNoError) {
                teardown_error = make_error(ErrorType::TeardownError,
                                            "Failed to stop input stream: " + std::string(Pa_GetErrorText(err)));
            }
            err = Pa_CloseStream(input_stream_);
            if (err != paNoError) {
                teardown_error = make_error(ErrorType::TeardownError,
                                            "Failed to close input stream: " + std::string(Pa_GetErrorText(err)));
            }
            input_stream_ = nullptr;
            LOG_AUDIO("capture device released");
        }

        if (output_stream_) {
            // Abort rather than drain: pending speech is discarded on teardown
            PaError err = Pa_AbortStream(output_stream_);
            if (err != paNoError) {
                teardown_error = make_error(ErrorType::TeardownError,
                                            "Failed to abort output stream: " + std::string(Pa_GetErrorText(err)));
            }
            err = Pa_CloseStream(output_stream_);
            if (err != paNoError) {
                teardown_error = make_error(ErrorType::TeardownError,
                                            "Failed to close output stream: " + std::string(Pa_GetErrorText(err)));
            }
            output_stream_ = nullptr;
            LOG_AUDIO("output device released");
        }

        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            on_frame_ = nullptr;
            pending_.clear();
        }
        {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            scheduled_.clear();
        }
        frames_rendered_ = 0;
        output_rate_ = 0;

        while (pa_refs_ > 0) {
            Pa_Terminate();
            pa_refs_--;
        }

        if (teardown_error) {
            return teardown_error;
        }
        return VoidResult();
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            oss << " default rate " << info->defaultSampleRate;
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    struct Scheduled {
        uint64_t start_frame = 0;
        std::vector<float> samples;
        size_t offset = 0;
    };

    int find_device(const std::string& name, bool is_input) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            if (default_idx != paNoDevice) {
                return default_idx;
            }
            return -1;
        }

        // Try parsing as numeric device index
        try {
            size_t consumed = 0;
            int device_idx = std::stoi(name, &consumed);
            if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, continue to name matching
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || name != info->name) continue;
            if (is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0) {
                return i;
            }
        }

        return -1;
    }

    static int capture_callback(const void* input, void* output,
                                unsigned long frame_count,
                                const PaStreamCallbackTimeInfo* time_info,
                                PaStreamCallbackFlags status_flags,
                                void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        if (!input) return paContinue;

        const float* in = static_cast<const float*>(input);
        std::lock_guard<std::mutex> lock(self->capture_mutex_);
        if (!self->on_frame_ || self->frame_size_ == 0) return paContinue;

        // Re-chunk in case the host delivers a different buffer size
        for (unsigned long i = 0; i < frame_count; i++) {
            self->pending_.push_back(in[i]);
            if (self->pending_.size() == self->frame_size_) {
                self->on_frame_(self->pending_);
                self->pending_.clear();
            }
        }
        return paContinue;
    }

    static int playback_callback(const void* input, void* output,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* time_info,
                                 PaStreamCallbackFlags status_flags,
                                 void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        float* out = static_cast<float*>(output);

        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        uint64_t clock = self->frames_rendered_.load();

        for (unsigned long i = 0; i < frame_count; i++) {
            float value = 0.0f;
            if (!self->scheduled_.empty()) {
                Scheduled& front = self->scheduled_.front();
                // A buffer whose start already passed plays immediately; the
                // next one still waits for this one to finish.
                if (front.offset > 0 || clock + i >= front.start_frame) {
                    value = front.samples[front.offset++];
                    if (front.offset >= front.samples.size()) {
                        self->scheduled_.pop_front();
                    }
                }
            }
            out[i] = value;
        }

        self->frames_rendered_ = clock + frame_count;
        return paContinue;
    }

    std::string input_device_;
    std::string output_device_;
    PaStream* input_stream_;
    PaStream* output_stream_;
    int pa_refs_;

    std::mutex capture_mutex_;
    AudioFrameCallback on_frame_;
    size_t frame_size_;
    AudioFrame pending_;

    mutable std::mutex playback_mutex_;
    std::deque<Scheduled> scheduled_;
    std::atomic<int> output_rate_;
    std::atomic<uint64_t> frames_rendered_;
};

AudioIO::AudioIO(const std::string& input_device, const std::string& output_device)
    : pimpl_(std::make_unique<Impl>(input_device, output_device)) {}

AudioIO::~AudioIO() = default;

VoidResult AudioIO::start_capture(int sample_rate, int frame_size, AudioFrameCallback on_frame) {
    return pimpl_->start_capture(sample_rate, frame_size, std::move(on_frame));
}

VoidResult AudioIO::start_playback(int sample_rate) {
    return pimpl_->start_playback(sample_rate);
}

double AudioIO::output_time() const {
    return pimpl_->output_time();
}

VoidResult AudioIO::schedule_playback(const PlaybackBuffer& buffer, double start_time) {
    return pimpl_->schedule_playback(buffer, start_time);
}

VoidResult AudioIO::stop() {
    return pimpl_->stop();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace lumiere

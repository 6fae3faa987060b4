#include "live_session.h"
#include "frame_codec.h"
#include "logger.h"
#include "playback_scheduler.h"
#include "tool_dispatcher.h"
#include "transcript_accumulator.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace lumiere {

namespace {

// Session whose inbound event the current thread is routing, if any
thread_local const void* t_routing_session = nullptr;

bool is_ended(SessionState state) {
    return state == SessionState::Closed || state == SessionState::Failed;
}

} // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Open: return "Open";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
        default: return "Unknown";
    }
}

class LiveSession::Impl {
public:
    Impl(std::unique_ptr<AudioBridge> bridge, TransportFactory transport_factory,
         SessionCallbacks callbacks, SessionOptions options)
        : bridge_(std::move(bridge))
        , transport_factory_(std::move(transport_factory))
        , callbacks_(std::move(callbacks))
        , options_(options)
        , user_(Speaker::User)
        , agent_(Speaker::Agent) {
        options_.outbound_queue_depth = std::max<size_t>(1, options_.outbound_queue_depth);
    }

    ~Impl() {
        close();
        join_worker(connect_thread_, true);
        join_worker(sender_thread_, true);
        join_worker(receiver_thread_, true);
    }

    bool open(const SessionConfig& config) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_ended(state_) && state_ != SessionState::Idle) {
                LOG_WARN("open() ignored: session is " + std::string(session_state_name(state_)));
                return false;
            }
            if (teardown_running_) {
                LOG_WARN("open() ignored: previous session is still tearing down");
                return false;
            }
        }

        // Workers of a previous session have already observed the inactive guard
        join_worker(connect_thread_, true);
        join_worker(sender_thread_, true);
        join_worker(receiver_thread_, true);

        std::unique_ptr<LiveTransport> transport = transport_factory_ ? transport_factory_() : nullptr;
        if (!transport) {
            LOG_ERROR("open() failed: no transport available");
            return false;
        }

        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            transport_ = std::move(transport);
            config_ = config;
            outbound_.clear();
            stats_ = SessionStats();
            close_requested_ = false;
            gen = ++generation_;
            state_ = SessionState::Connecting;
            cv_.notify_all();
        }

        LOG_SESSION("connecting (model " + config.model + ", voice " + config.voice_name + ")");
        connect_thread_ = std::thread(&Impl::run_connect, this, gen, config);
        return true;
    }

    void close() {
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == SessionState::Connecting) {
                close_requested_ = true;
            }
            gen = generation_;
        }

        // The handshake is bounded by its own timeout
        join_worker(connect_thread_);
        teardown(gen, CloseReason::Requested, "closed by host", SessionState::Closed);
        join_worker(sender_thread_);
        join_worker(receiver_thread_);
    }

    void set_muted(bool muted) {
        bool was = muted_.exchange(muted);
        if (was == muted) return;
        if (muted) {
            std::lock_guard<std::mutex> lock(mutex_);
            outbound_.clear();
        }
        LOG_SESSION(muted ? "microphone muted" : "microphone unmuted");
    }

    bool is_muted() const { return muted_.load(); }

    SessionState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool wait_until_open(int timeout_ms) const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
            return state_ != SessionState::Connecting;
        });
        return state_ == SessionState::Open;
    }

    bool wait_until_ended(int timeout_ms) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this]() {
            return is_ended(state_) && !teardown_running_;
        });
    }

    double playback_watermark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return scheduler_.watermark();
    }

    SessionStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    /// Marks the current thread as routing one inbound event; the caller
    /// has already counted it in in_flight_
    class RoutingScope {
    public:
        explicit RoutingScope(Impl& impl) : impl_(impl), previous_(t_routing_session) {
            t_routing_session = &impl_;
        }
        ~RoutingScope() {
            t_routing_session = previous_;
            std::lock_guard<std::mutex> lock(impl_.mutex_);
            --impl_.in_flight_;
            impl_.cv_.notify_all();
        }
    private:
        Impl& impl_;
        const void* previous_;
    };

    struct FatalEvent {
        CloseReason reason;
        std::string message;
        SessionState final_state;
    };

    // Caller holds mutex_
    bool is_active(uint64_t gen) const {
        return state_ == SessionState::Open && generation_ == gen;
    }

    bool still_active(uint64_t gen) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return is_active(gen);
    }

    /**
     * Join a worker unless it is the calling thread (a host callback calling
     * back in). That worker stays joinable for the next caller, or is
     * detached when the handle must be released right away.
     */
    static void join_worker(std::thread& worker, bool detach_self = false) {
        if (!worker.joinable()) return;
        if (worker.get_id() == std::this_thread::get_id()) {
            if (detach_self) worker.detach();
            return;
        }
        worker.join();
    }

    // ---------------------------------------------------------------------
    // Connecting
    // ---------------------------------------------------------------------

    VoidResult acquire_audio(uint64_t gen, const SessionConfig& config) {
        auto captured = bridge_->start_capture(
            config.input_sample_rate, config.frame_size,
            [this, gen](const AudioFrame& frame) { on_capture_frame(gen, frame); });
        if (captured.is_error()) {
            return captured;
        }
        return bridge_->start_playback(config.output_sample_rate);
    }

    void run_connect(uint64_t gen, SessionConfig config) {
        // Device acquisition and the handshake run concurrently; both must succeed
        auto audio_future = std::async(std::launch::async, [this, gen, &config]() {
            return acquire_audio(gen, config);
        });
        VoidResult connected = transport_->connect(config);
        VoidResult audio = audio_future.get();

        std::unique_lock<std::mutex> lock(mutex_);
        if (generation_ != gen || state_ != SessionState::Connecting) {
            return;
        }
        if (close_requested_) {
            // close() is waiting on this thread and finishes the teardown
            return;
        }

        if (audio.is_error()) {
            lock.unlock();
            LOG_ERROR("audio device unavailable: " + audio.error().message);
            teardown(gen, CloseReason::DeviceUnavailable, audio.error().message, SessionState::Failed);
            return;
        }
        if (connected.is_error()) {
            lock.unlock();
            LOG_ERROR("live connection failed: " + connected.error().message);
            teardown(gen, CloseReason::ConnectionError, connected.error().message, SessionState::Failed);
            return;
        }

        state_ = SessionState::Open;
        cv_.notify_all();
        sender_thread_ = std::thread(&Impl::send_loop, this, gen);
        receiver_thread_ = std::thread(&Impl::receive_loop, this, gen);
        LOG_SESSION("open");
    }

    // ---------------------------------------------------------------------
    // Outbound
    // ---------------------------------------------------------------------

    // Audio device thread
    void on_capture_frame(uint64_t gen, const AudioFrame& frame) {
        if (muted_.load()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_active(gen)) {
            return;
        }
        if (outbound_.size() >= options_.outbound_queue_depth) {
            outbound_.pop_front();
            ++stats_.frames_dropped;
        }
        outbound_.push_back(frame);
        ++stats_.frames_captured;
        cv_.notify_all();
    }

    void send_loop(uint64_t gen) {
        int sample_rate = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sample_rate = config_.input_sample_rate;
        }

        while (true) {
            AudioFrame frame;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [&]() { return !outbound_.empty() || !is_active(gen); });
                if (!is_active(gen)) {
                    return;
                }
                frame = std::move(outbound_.front());
                outbound_.pop_front();
                ++in_flight_;
            }

            std::string payload = codec::encode_outbound(frame);
            VoidResult sent = payload.empty() ? VoidResult() : transport_->send_audio(payload, sample_rate);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --in_flight_;
                if (sent.is_ok() && !payload.empty()) {
                    ++stats_.frames_sent;
                }
                cv_.notify_all();
            }

            if (sent.is_error()) {
                if (sent.error().type == ErrorType::ConnectionError) {
                    teardown(gen, CloseReason::ConnectionError, sent.error().message, SessionState::Failed);
                    return;
                }
                LOG_WARN("audio frame not sent: " + sent.error().to_string());
            }
        }
    }

    // ---------------------------------------------------------------------
    // Inbound
    // ---------------------------------------------------------------------

    void receive_loop(uint64_t gen) {
        while (still_active(gen)) {
            auto received = transport_->receive(options_.receive_poll_ms);
            if (received.is_error()) {
                const Error& err = received.error();
                if (err.type == ErrorType::Timeout) {
                    continue;
                }
                if (err.type == ErrorType::CodecError) {
                    LOG_CODEC("dropping inbound message: " + err.message);
                    std::lock_guard<std::mutex> lock(mutex_);
                    ++stats_.codec_errors;
                    continue;
                }
                if (!still_active(gen)) {
                    return;  // channel closed by our own teardown
                }
                LOG_ERROR("live connection lost: " + err.message);
                teardown(gen, CloseReason::ConnectionError, err.message, SessionState::Failed);
                return;
            }

            std::optional<FatalEvent> fatal = route_event(gen, received.value());
            if (fatal) {
                teardown(gen, fatal->reason, fatal->message, fatal->final_state);
                return;
            }
        }
    }

    /**
     * Route one server message. Order: transcripts, turn completion, audio,
     * tool calls, then terminal events. Every step re-checks the active guard.
     */
    std::optional<FatalEvent> route_event(uint64_t gen, const ServerEvent& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_active(gen)) {
                return std::nullopt;
            }
            ++in_flight_;
        }
        RoutingScope scope(*this);

        if (event.input_transcription &&
            !append_transcript(gen, user_, callbacks_.on_user_transcript, *event.input_transcription)) {
            return std::nullopt;
        }
        if (event.output_transcription &&
            !append_transcript(gen, agent_, callbacks_.on_agent_transcript, *event.output_transcription)) {
            return std::nullopt;
        }

        if (event.turn_complete && !complete_turn(gen)) {
            return std::nullopt;
        }

        for (const auto& chunk : event.audio_chunks) {
            if (!schedule_audio(gen, chunk)) {
                return std::nullopt;
            }
        }

        for (const auto& call : event.tool_calls) {
            std::optional<FatalEvent> fatal;
            if (!handle_tool_call(gen, call, fatal)) {
                return fatal;
            }
        }

        if (event.session_error) {
            return FatalEvent{CloseReason::ConnectionError, *event.session_error, SessionState::Failed};
        }
        if (event.session_closed) {
            LOG_SESSION("remote closed the session" +
                        (event.close_reason.empty() ? std::string() : ": " + event.close_reason));
            return FatalEvent{CloseReason::RemoteClosed, event.close_reason, SessionState::Closed};
        }
        return std::nullopt;
    }

    bool append_transcript(uint64_t gen, TranscriptAccumulator& accumulator,
                           const TranscriptCallback& callback, const std::string& delta) {
        if (delta.empty()) {
            return true;
        }
        std::string text;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_active(gen)) return false;
            text = accumulator.append(delta);
        }
        if (callback) {
            callback(text, false);
        }
        return true;
    }

    bool complete_turn(uint64_t gen) {
        std::optional<std::string> user_final;
        std::optional<std::string> agent_final;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_active(gen)) return false;
            user_final = user_.flush();
            agent_final = agent_.flush();
        }
        if (user_final && callbacks_.on_user_transcript) {
            callbacks_.on_user_transcript(*user_final, true);
        }
        if (agent_final && callbacks_.on_agent_transcript) {
            callbacks_.on_agent_transcript(*agent_final, true);
        }
        return true;
    }

    bool schedule_audio(uint64_t gen, const std::string& chunk) {
        int sample_rate = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_active(gen)) return false;
            sample_rate = config_.output_sample_rate;
        }

        auto decoded = codec::decode_inbound(chunk, sample_rate);
        if (decoded.is_error()) {
            LOG_CODEC("dropping audio chunk: " + decoded.error().message);
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.codec_errors;
            return true;
        }
        const PlaybackBuffer& buffer = decoded.value();

        VoidResult scheduled;
        {
            // Held across the bridge call so teardown cannot interleave
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_active(gen)) return false;
            double start = scheduler_.schedule(bridge_->output_time(), buffer.duration());
            scheduled = bridge_->schedule_playback(buffer, start);
            if (scheduled.is_ok()) {
                ++stats_.buffers_scheduled;
            }
        }
        if (scheduled.is_error()) {
            LOG_WARN("playback buffer not scheduled: " + scheduled.error().to_string());
        }
        return true;
    }

    bool handle_tool_call(uint64_t gen, const ToolCall& call, std::optional<FatalEvent>& fatal) {
        DispatchResult dispatched = dispatcher_.dispatch(call);
        if (!dispatched.recognized) {
            return true;
        }
        if (!still_active(gen)) return false;

        if (callbacks_.on_products_found) {
            callbacks_.on_products_found(*dispatched.products);
        }

        // The acknowledgment goes out only after the host has the products
        if (!still_active(gen)) return false;
        VoidResult sent = transport_->send_tool_response(ToolDispatcher::acknowledge(call));
        if (sent.is_error()) {
            if (sent.error().type == ErrorType::ConnectionError) {
                fatal = FatalEvent{CloseReason::ConnectionError, sent.error().message, SessionState::Failed};
                return false;
            }
            LOG_WARN("tool response for " + call.id + " not sent: " + sent.error().to_string());
            return true;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.tool_calls_acknowledged;
        return true;
    }

    // ---------------------------------------------------------------------
    // Teardown
    // ---------------------------------------------------------------------

    /**
     * Runs at most once per generation. Returns false when another caller
     * already owns (or finished) the teardown.
     */
    bool teardown(uint64_t gen, CloseReason reason, const std::string& message, SessionState final_state) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (generation_ != gen ||
                (state_ != SessionState::Connecting && state_ != SessionState::Open)) {
                return false;
            }
            state_ = SessionState::Closing;
            teardown_running_ = true;
            outbound_.clear();
            cv_.notify_all();

            // In-flight sends and event routing finish before resources go away
            size_t own = (t_routing_session == this) ? 1 : 0;
            bool drained = cv_.wait_for(lock, std::chrono::milliseconds(options_.close_timeout_ms),
                                        [&]() { return in_flight_ <= own; });
            if (!drained) {
                LOG_WARN("teardown proceeding with " + std::to_string(in_flight_ - own) +
                         " operation(s) still in flight");
            }
        }

        LOG_SESSION(std::string("closing (") + close_reason_name(reason) + ")");

        // (1) terminate the remote session unless the remote already did
        if (transport_ && !transport_->is_remote_closed()) {
            auto closed = transport_->close(options_.close_timeout_ms);
            if (closed.is_error()) {
                LOG_WARN(make_error(ErrorType::TeardownError,
                                    "transport close: " + closed.error().to_string()).to_string());
            }
        }

        // (2)+(3) stop capture and playback, release both devices
        auto stopped = bridge_->stop();
        if (stopped.is_error()) {
            LOG_WARN(stopped.error().to_string());
        }

        // (4) clear transcripts and the watermark, (5) final state
        {
            std::lock_guard<std::mutex> lock(mutex_);
            user_.reset();
            agent_.reset();
            scheduler_.reset();
            outbound_.clear();
            state_ = final_state;
            cv_.notify_all();
        }

        LOG_SESSION(std::string(session_state_name(final_state)) +
                    (message.empty() ? std::string() : ": " + message));
        if (callbacks_.on_closed) {
            callbacks_.on_closed(reason, message);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            teardown_running_ = false;
            cv_.notify_all();
        }
        return true;
    }

    std::unique_ptr<AudioBridge> bridge_;
    TransportFactory transport_factory_;
    std::unique_ptr<LiveTransport> transport_;
    SessionCallbacks callbacks_;
    SessionOptions options_;
    ToolDispatcher dispatcher_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SessionState state_ = SessionState::Idle;
    uint64_t generation_ = 0;
    bool close_requested_ = false;
    bool teardown_running_ = false;
    size_t in_flight_ = 0;
    SessionConfig config_;
    TranscriptAccumulator user_;
    TranscriptAccumulator agent_;
    PlaybackScheduler scheduler_;
    std::deque<AudioFrame> outbound_;
    SessionStats stats_;

    std::atomic<bool> muted_{false};

    std::thread connect_thread_;
    std::thread sender_thread_;
    std::thread receiver_thread_;
};

LiveSession::LiveSession(std::unique_ptr<AudioBridge> bridge,
                         TransportFactory transport_factory,
                         SessionCallbacks callbacks,
                         SessionOptions options)
    : pimpl_(std::make_unique<Impl>(std::move(bridge), std::move(transport_factory),
                                    std::move(callbacks), options)) {}

LiveSession::~LiveSession() = default;

bool LiveSession::open(const SessionConfig& config) {
    return pimpl_->open(config);
}

void LiveSession::close() {
    pimpl_->close();
}

void LiveSession::set_muted(bool muted) {
    pimpl_->set_muted(muted);
}

bool LiveSession::is_muted() const {
    return pimpl_->is_muted();
}

SessionState LiveSession::state() const {
    return pimpl_->state();
}

bool LiveSession::wait_until_open(int timeout_ms) const {
    return pimpl_->wait_until_open(timeout_ms);
}

bool LiveSession::wait_until_ended(int timeout_ms) const {
    return pimpl_->wait_until_ended(timeout_ms);
}

double LiveSession::playback_watermark() const {
    return pimpl_->playback_watermark();
}

SessionStats LiveSession::stats() const {
    return pimpl_->stats();
}

} // namespace lumiere

/**
 * Live session lifecycle tests against in-memory audio and transport fakes.
 * Asserts:
 * - Frames captured while Open are encoded and sent in capture order.
 * - Muted frames are never sent; unmuting resumes from the next frame.
 * - Frames captured while Connecting are discarded.
 * - A full outbound queue drops the oldest unsent frame.
 * - Transcript partials accumulate and turn completion flushes only non-empty buffers.
 * - Inbound audio is scheduled back-to-back on the output clock; bad chunks are dropped.
 * - displayProducts calls reach the host before the acknowledgment; invalid ones get neither.
 * - close() is idempotent: devices released once, on_closed fired once.
 * - Handshake failure after capture was acquired releases capture once and reports ConnectionError.
 * - Remote close and transport failure end the session with the matching reason.
 * - A locally requested close is not logged as a lost connection.
 *
 * Run from build dir: ./test_live_session
 * No PortAudio or network required.
 */

#include "audio_bridge.h"
#include "core/constants.h"
#include "frame_codec.h"
#include "live_session.h"
#include "live_transport.h"
#include "logger.h"
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace lumiere;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

// =============================================================================
// Fakes
// =============================================================================

struct BridgeState {
    std::mutex mutex;
    AudioFrameCallback on_frame;
    bool capturing = false;
    bool playing = false;
    bool fail_capture = false;
    int capture_starts = 0;
    int capture_releases = 0;
    int stop_calls = 0;
    double clock = 0.0;
    std::vector<std::pair<PlaybackBuffer, double>> scheduled;
};

class FakeAudioBridge : public AudioBridge {
public:
    explicit FakeAudioBridge(std::shared_ptr<BridgeState> state) : state_(std::move(state)) {}

    VoidResult start_capture(int, int, AudioFrameCallback on_frame) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->fail_capture) {
            return make_device_error("microphone permission denied");
        }
        state_->on_frame = std::move(on_frame);
        state_->capturing = true;
        ++state_->capture_starts;
        return VoidResult();
    }

    VoidResult start_playback(int) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->playing = true;
        return VoidResult();
    }

    double output_time() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->clock;
    }

    VoidResult schedule_playback(const PlaybackBuffer& buffer, double start_time) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->playing) {
            return make_error(ErrorType::InvalidState, "playback not running");
        }
        state_->scheduled.emplace_back(buffer, start_time);
        return VoidResult();
    }

    VoidResult stop() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->stop_calls;
        if (state_->capturing) {
            ++state_->capture_releases;
        }
        state_->capturing = false;
        state_->playing = false;
        state_->on_frame = nullptr;
        return VoidResult();
    }

private:
    std::shared_ptr<BridgeState> state_;
};

/// Simulates the device thread delivering one frame
static void emit_frame(BridgeState& state, const AudioFrame& frame) {
    AudioFrameCallback callback;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        callback = state.on_frame;
    }
    if (callback) callback(frame);
}

struct TransportState {
    std::mutex mutex;
    std::condition_variable cv;
    int created = 0;
    int connects = 0;
    int close_calls = 0;
    bool fail_connect = false;
    int connect_delay_ms = 0;
    std::atomic<bool> hold_connect{false};
    std::atomic<bool> hold_send{false};
    std::atomic<bool> send_in_progress{false};
    bool block_receive = false;   // receive() waits for an event or close, ignoring its timeout
    int receive_calls = 0;
    bool remote_closed = false;
    std::deque<Result<ServerEvent>> inbound;
    std::vector<std::string> sent_audio;
    std::vector<ToolResponse> tool_responses;
};

class FakeTransport : public LiveTransport {
public:
    explicit FakeTransport(std::shared_ptr<TransportState> state) : state_(std::move(state)) {}

    VoidResult connect(const SessionConfig&) override {
        while (state_->hold_connect.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        int delay = 0;
        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->connects;
            delay = state_->connect_delay_ms;
            fail = state_->fail_connect;
        }
        if (delay > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        if (fail) return make_connection_error("handshake rejected");
        return VoidResult();
    }

    VoidResult send_audio(const std::string& payload, int) override {
        state_->send_in_progress = true;
        while (state_->hold_send.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->sent_audio.push_back(payload);
        state_->send_in_progress = false;
        state_->cv.notify_all();
        return VoidResult();
    }

    VoidResult send_tool_response(const ToolResponse& response) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->tool_responses.push_back(response);
        state_->cv.notify_all();
        return VoidResult();
    }

    Result<ServerEvent> receive(int timeout_ms) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        ++state_->receive_calls;
        state_->cv.notify_all();
        auto ready = [this]() { return !state_->inbound.empty() || closed_locally_; };
        if (state_->block_receive) {
            state_->cv.wait(lock, ready);
        } else {
            state_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready);
        }
        if (closed_locally_) {
            return make_connection_error("channel closed locally");
        }
        if (state_->inbound.empty()) {
            return make_timeout_error("no event");
        }
        Result<ServerEvent> next = state_->inbound.front();
        state_->inbound.pop_front();
        if (next.is_ok() && next.value().session_closed) {
            state_->remote_closed = true;
        }
        state_->cv.notify_all();
        return next;
    }

    VoidResult close(int) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->close_calls;
        closed_locally_ = true;
        state_->cv.notify_all();
        return VoidResult();
    }

    bool is_remote_closed() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->remote_closed;
    }

private:
    std::shared_ptr<TransportState> state_;
    bool closed_locally_ = false;  // guarded by state_->mutex
};

// =============================================================================
// Helpers
// =============================================================================

struct HostLog {
    std::mutex mutex;
    std::vector<std::pair<std::string, bool>> user;
    std::vector<std::pair<std::string, bool>> agent;
    std::vector<std::vector<Product>> products;
    std::vector<size_t> acks_seen_at_callback;
    std::vector<CloseReason> closed;
};

struct Harness {
    std::shared_ptr<BridgeState> bridge = std::make_shared<BridgeState>();
    std::shared_ptr<TransportState> transport = std::make_shared<TransportState>();
    std::shared_ptr<HostLog> host = std::make_shared<HostLog>();
    std::function<void()> on_products_hook;
    std::unique_ptr<LiveSession> session;

    explicit Harness(SessionOptions options = SessionOptions()) {
        options.close_timeout_ms = 500;
        options.receive_poll_ms = 10;

        auto host_log = host;
        auto transport_state = transport;
        SessionCallbacks callbacks;
        callbacks.on_user_transcript = [host_log](const std::string& text, bool is_final) {
            std::lock_guard<std::mutex> lock(host_log->mutex);
            host_log->user.emplace_back(text, is_final);
        };
        callbacks.on_agent_transcript = [host_log](const std::string& text, bool is_final) {
            std::lock_guard<std::mutex> lock(host_log->mutex);
            host_log->agent.emplace_back(text, is_final);
        };
        callbacks.on_products_found = [this, host_log, transport_state](const std::vector<Product>& products) {
            size_t acks = 0;
            {
                std::lock_guard<std::mutex> lock(transport_state->mutex);
                acks = transport_state->tool_responses.size();
            }
            {
                std::lock_guard<std::mutex> lock(host_log->mutex);
                host_log->products.push_back(products);
                host_log->acks_seen_at_callback.push_back(acks);
            }
            if (on_products_hook) on_products_hook();
        };
        callbacks.on_closed = [host_log](CloseReason reason, const std::string&) {
            std::lock_guard<std::mutex> lock(host_log->mutex);
            host_log->closed.push_back(reason);
        };

        session = std::make_unique<LiveSession>(
            std::make_unique<FakeAudioBridge>(bridge),
            [transport_state]() {
                {
                    std::lock_guard<std::mutex> lock(transport_state->mutex);
                    ++transport_state->created;
                }
                return std::make_unique<FakeTransport>(transport_state);
            },
            callbacks, options);
    }

    void push(const ServerEvent& event) {
        std::lock_guard<std::mutex> lock(transport->mutex);
        transport->inbound.push_back(event);
        transport->cv.notify_all();
    }

    void push_error(const Error& error) {
        std::lock_guard<std::mutex> lock(transport->mutex);
        transport->inbound.push_back(error);
        transport->cv.notify_all();
    }

    size_t sent_count() {
        std::lock_guard<std::mutex> lock(transport->mutex);
        return transport->sent_audio.size();
    }

    size_t closed_count() {
        std::lock_guard<std::mutex> lock(host->mutex);
        return host->closed.size();
    }
};

static bool wait_for(const std::function<bool()>& condition, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

static SessionConfig test_config() {
    SessionConfig config;
    config.model = "test-model";
    config.voice_name = "Kore";
    config.system_instruction = "You are Lumiere.";
    config.tools_json = "[]";
    return config;
}

static AudioFrame make_frame(float value) {
    return AudioFrame(constants::audio::CAPTURE_FRAME_SIZE, value);
}

/// Pushes a marker transcript and waits until the host sees it, so every
/// earlier event has been fully routed
static bool drain_inbound(Harness& h, const std::string& marker) {
    ServerEvent event;
    event.output_transcription = marker;
    h.push(event);
    return wait_for([&]() {
        std::lock_guard<std::mutex> lock(h.host->mutex);
        for (const auto& update : h.host->agent) {
            if (update.first.find(marker) != std::string::npos) return true;
        }
        return false;
    });
}

static std::string make_audio_payload(size_t samples, float value) {
    AudioFrame frame(samples, value);
    return codec::encode_outbound(frame);
}

// =============================================================================
// Scenarios
// =============================================================================

static void test_end_to_end() {
    Harness h;
    ASSERT(h.session->state() == SessionState::Idle);
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));
    ASSERT(h.session->state() == SessionState::Open);

    std::vector<AudioFrame> frames = {make_frame(0.1f), make_frame(0.2f), make_frame(0.3f)};
    for (size_t i = 0; i < frames.size(); ++i) {
        emit_frame(*h.bridge, frames[i]);
        // Keep the queue shallow so no frame is evicted
        ASSERT(wait_for([&]() { return h.sent_count() == i + 1; }));
    }

    {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        ASSERT(h.transport->sent_audio.size() == 3);
        for (size_t i = 0; i < frames.size() && i < h.transport->sent_audio.size(); ++i) {
            ASSERT(h.transport->sent_audio[i] == codec::encode_outbound(frames[i]));
        }
    }

    // Turn complete with nothing buffered emits no final update
    ServerEvent turn;
    turn.turn_complete = true;
    h.push(turn);
    ASSERT(drain_inbound(h, "marker"));
    {
        std::lock_guard<std::mutex> lock(h.host->mutex);
        for (const auto& update : h.host->user) ASSERT(!update.second);
        for (const auto& update : h.host->agent) ASSERT(!update.second);
    }

    h.session->close();
    ASSERT(h.session->state() == SessionState::Closed);
    ASSERT(h.bridge->capture_releases == 1);
    ASSERT(h.closed_count() == 1);
    ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::Requested);
    ASSERT(h.transport->close_calls == 1);
    ASSERT(h.session->playback_watermark() == 0.0);
}

static void test_close_idempotent() {
    Harness h;
    h.session->close();  // never opened: nothing to report
    ASSERT(h.closed_count() == 0);
    ASSERT(h.session->state() == SessionState::Idle);

    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));
    ASSERT(!h.session->open(test_config()));  // already open

    h.session->close();
    h.session->close();
    ASSERT(h.closed_count() == 1);
    ASSERT(h.bridge->capture_releases == 1);
    ASSERT(h.transport->close_calls == 1);

    // Late frames after teardown are no-ops
    emit_frame(*h.bridge, make_frame(0.5f));
    ASSERT(h.sent_count() == 0);

    // Destruction after close does not report again
    h.session.reset();
    ASSERT(h.closed_count() == 1);
}

static void test_destructor_closes() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));
    h.session.reset();
    ASSERT(h.closed_count() == 1);
    ASSERT(h.host->closed[0] == CloseReason::Requested);
    ASSERT(h.bridge->capture_releases == 1);
}

static void test_mute() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    h.session->set_muted(true);
    ASSERT(h.session->is_muted());
    emit_frame(*h.bridge, make_frame(0.1f));
    emit_frame(*h.bridge, make_frame(0.2f));
    emit_frame(*h.bridge, make_frame(0.3f));
    ASSERT(h.bridge->capturing);  // device stays open while muted

    h.session->set_muted(false);
    AudioFrame after = make_frame(0.4f);
    emit_frame(*h.bridge, after);
    ASSERT(wait_for([&]() { return h.sent_count() == 1; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    ASSERT(h.sent_count() == 1);
    {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        ASSERT(!h.transport->sent_audio.empty() &&
               h.transport->sent_audio[0] == codec::encode_outbound(after));
    }
    ASSERT(h.session->stats().frames_captured == 1);
    h.session->close();
}

static void test_frames_while_connecting_discarded() {
    Harness h;
    h.transport->hold_connect = true;
    ASSERT(h.session->open(test_config()));
    ASSERT(wait_for([&]() {
        std::lock_guard<std::mutex> lock(h.bridge->mutex);
        return h.bridge->capturing;
    }));
    ASSERT(h.session->state() == SessionState::Connecting);
    emit_frame(*h.bridge, make_frame(0.1f));
    emit_frame(*h.bridge, make_frame(0.2f));

    h.transport->hold_connect = false;
    ASSERT(h.session->wait_until_open(2000));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    ASSERT(h.sent_count() == 0);

    AudioFrame live = make_frame(0.3f);
    emit_frame(*h.bridge, live);
    ASSERT(wait_for([&]() { return h.sent_count() == 1; }));
    h.session->close();
}

static void test_backpressure_drops_oldest() {
    SessionOptions options;
    options.outbound_queue_depth = 2;
    Harness h(options);
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    h.transport->hold_send = true;
    std::vector<AudioFrame> frames;
    for (int i = 0; i < 5; ++i) frames.push_back(make_frame(0.1f * static_cast<float>(i + 1)));

    emit_frame(*h.bridge, frames[0]);
    ASSERT(wait_for([&]() { return h.transport->send_in_progress.load(); }));
    for (int i = 1; i < 5; ++i) emit_frame(*h.bridge, frames[i]);

    h.transport->hold_send = false;
    ASSERT(wait_for([&]() { return h.sent_count() == 3; }));
    {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        ASSERT(h.transport->sent_audio.size() == 3);
        if (h.transport->sent_audio.size() == 3) {
            ASSERT(h.transport->sent_audio[0] == codec::encode_outbound(frames[0]));
            ASSERT(h.transport->sent_audio[1] == codec::encode_outbound(frames[3]));
            ASSERT(h.transport->sent_audio[2] == codec::encode_outbound(frames[4]));
        }
    }
    ASSERT(h.session->stats().frames_dropped == 2);
    h.session->close();
}

static void test_transcripts() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    ServerEvent e1;
    e1.input_transcription = "Show me ";
    h.push(e1);
    ServerEvent e2;
    e2.input_transcription = "a blazer";
    e2.output_transcription = "Sure";
    h.push(e2);
    ServerEvent done;
    done.turn_complete = true;
    h.push(done);
    ServerEvent next;
    next.input_transcription = "Thanks";
    h.push(next);
    ASSERT(drain_inbound(h, "marker"));

    {
        std::lock_guard<std::mutex> lock(h.host->mutex);
        const auto& user = h.host->user;
        ASSERT(user.size() == 4);
        if (user.size() == 4) {
            ASSERT(user[0].first == "Show me " && !user[0].second);
            ASSERT(user[1].first == "Show me a blazer" && !user[1].second);
            ASSERT(user[2].first == "Show me a blazer" && user[2].second);
            ASSERT(user[3].first == "Thanks" && !user[3].second);
        }
        const auto& agent = h.host->agent;
        ASSERT(agent.size() >= 2);
        if (agent.size() >= 2) {
            ASSERT(agent[0].first == "Sure" && !agent[0].second);
            ASSERT(agent[1].first == "Sure" && agent[1].second);
        }
    }
    h.session->close();
}

static void test_audio_scheduling() {
    Harness h;
    h.bridge->clock = 1.0;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    // 2400 samples at 24 kHz = 100 ms each
    ServerEvent audio;
    audio.audio_chunks.push_back(make_audio_payload(2400, 0.25f));
    audio.audio_chunks.push_back("not base64!");
    audio.audio_chunks.push_back(make_audio_payload(2400, -0.25f));
    h.push(audio);
    ASSERT(drain_inbound(h, "marker"));

    {
        std::lock_guard<std::mutex> lock(h.bridge->mutex);
        ASSERT(h.bridge->scheduled.size() == 2);
        if (h.bridge->scheduled.size() == 2) {
            ASSERT(h.bridge->scheduled[0].first.sample_rate == 24000);
            ASSERT(h.bridge->scheduled[0].first.samples.size() == 2400);
            ASSERT(std::abs(h.bridge->scheduled[0].second - 1.0) < 1e-9);
            ASSERT(std::abs(h.bridge->scheduled[1].second - 1.1) < 1e-9);
        }
    }
    ASSERT(std::abs(h.session->playback_watermark() - 1.2) < 1e-9);
    ASSERT(h.session->stats().codec_errors == 1);
    ASSERT(h.session->state() == SessionState::Open);

    // Output clock ran past the watermark: next buffer starts now
    {
        std::lock_guard<std::mutex> lock(h.bridge->mutex);
        h.bridge->clock = 5.0;
    }
    ServerEvent late;
    late.audio_chunks.push_back(make_audio_payload(2400, 0.1f));
    h.push(late);
    ASSERT(drain_inbound(h, "second"));
    {
        std::lock_guard<std::mutex> lock(h.bridge->mutex);
        ASSERT(h.bridge->scheduled.size() == 3);
        if (h.bridge->scheduled.size() == 3) {
            ASSERT(std::abs(h.bridge->scheduled[2].second - 5.0) < 1e-9);
        }
    }

    // Malformed messages are contained
    h.push_error(make_codec_error("bad json"));
    ASSERT(drain_inbound(h, "third"));
    ASSERT(h.session->state() == SessionState::Open);

    h.session->close();
    ASSERT(h.session->playback_watermark() == 0.0);
}

static void test_tool_dispatch() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    ServerEvent valid;
    ToolCall call;
    call.id = "call-1";
    call.name = "displayProducts";
    call.args_json = R"({"products":[
        {"brand":"Toteme","name":"Scarf Coat","price":"€890","description":"Long wool coat","category":"Coat"},
        {"brand":"Jacquemus","name":"Le Chiquito","price":"€520","description":"Mini bag"}]})";
    valid.tool_calls.push_back(call);
    h.push(valid);

    ASSERT(wait_for([&]() {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        return h.transport->tool_responses.size() == 1;
    }));
    {
        std::lock_guard<std::mutex> lock(h.host->mutex);
        ASSERT(h.host->products.size() == 1);
        if (h.host->products.size() == 1) {
            ASSERT(h.host->products[0].size() == 2);
            ASSERT(h.host->products[0][0].brand == "Toteme");
            ASSERT(h.host->products[0][1].name == "Le Chiquito");
            ASSERT(h.host->acks_seen_at_callback[0] == 0);  // host first, then the ack
        }
    }
    {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        ASSERT(h.transport->tool_responses[0].id == "call-1");
        ASSERT(h.transport->tool_responses[0].result == constants::protocol::TOOL_ACK_RESULT);
    }

    ServerEvent empty;
    ToolCall empty_call;
    empty_call.id = "call-2";
    empty_call.name = "displayProducts";
    empty_call.args_json = R"({"products":[]})";
    empty.tool_calls.push_back(empty_call);
    ToolCall unknown;
    unknown.id = "call-3";
    unknown.name = "orderPizza";
    unknown.args_json = "{}";
    empty.tool_calls.push_back(unknown);
    h.push(empty);
    ASSERT(drain_inbound(h, "marker"));

    {
        std::lock_guard<std::mutex> lock(h.host->mutex);
        ASSERT(h.host->products.size() == 1);
    }
    {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        ASSERT(h.transport->tool_responses.size() == 1);
    }
    ASSERT(h.session->stats().tool_calls_acknowledged == 1);
    h.session->close();
}

static void test_close_from_callback() {
    Harness h;
    h.on_products_hook = [&h]() { h.session->close(); };
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    ServerEvent valid;
    ToolCall call;
    call.id = "call-9";
    call.name = "displayProducts";
    call.args_json = R"({"products":[{"brand":"B","name":"N","price":"P","description":"D"}]})";
    valid.tool_calls.push_back(call);
    h.push(valid);

    ASSERT(h.session->wait_until_ended(2000));
    ASSERT(h.closed_count() == 1);
    {
        std::lock_guard<std::mutex> lock(h.transport->mutex);
        ASSERT(h.transport->tool_responses.empty());  // session ended before the ack
    }
    ASSERT(h.bridge->capture_releases == 1);
    h.session.reset();
    ASSERT(h.closed_count() == 1);
}

static void test_handshake_failure() {
    Harness h;
    h.transport->fail_connect = true;
    h.transport->connect_delay_ms = 50;  // capture is acquired first
    ASSERT(h.session->open(test_config()));
    ASSERT(!h.session->wait_until_open(2000));
    ASSERT(h.session->wait_until_ended(2000));

    ASSERT(h.session->state() == SessionState::Failed);
    ASSERT(h.bridge->capture_starts == 1);
    ASSERT(h.bridge->capture_releases == 1);
    ASSERT(!h.bridge->capturing);
    ASSERT(h.closed_count() == 1);
    ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::ConnectionError);

    h.session->close();
    h.session.reset();
    ASSERT(h.bridge->capture_releases == 1);
    ASSERT(h.closed_count() == 1);
}

static void test_device_unavailable() {
    Harness h;
    h.bridge->fail_capture = true;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_ended(2000));
    ASSERT(h.session->state() == SessionState::Failed);
    ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::DeviceUnavailable);
    ASSERT(h.transport->close_calls == 1);  // connected channel is terminated
    ASSERT(h.bridge->capture_releases == 0);
}

static void test_close_while_connecting() {
    Harness h;
    h.transport->hold_connect = true;
    ASSERT(h.session->open(test_config()));
    ASSERT(wait_for([&]() {
        std::lock_guard<std::mutex> lock(h.bridge->mutex);
        return h.bridge->capturing;
    }));

    std::thread releaser([&h]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        h.transport->hold_connect = false;
    });
    h.session->close();
    releaser.join();

    ASSERT(h.session->state() == SessionState::Closed);
    ASSERT(h.closed_count() == 1);
    ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::Requested);
    ASSERT(h.bridge->capture_releases == 1);
    ASSERT(h.sent_count() == 0);
}

static void test_remote_close() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    ServerEvent closed;
    closed.session_closed = true;
    closed.close_reason = "session expired";
    h.push(closed);
    ASSERT(h.session->wait_until_ended(2000));
    ASSERT(h.session->state() == SessionState::Closed);
    ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::RemoteClosed);
    ASSERT(h.transport->close_calls == 0);  // remote already ended it
    ASSERT(h.bridge->capture_releases == 1);

    h.session->close();
    ASSERT(h.closed_count() == 1);
}

static void test_transport_failure() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));

    h.push_error(make_connection_error("connection reset"));
    ASSERT(h.session->wait_until_ended(2000));
    ASSERT(h.session->state() == SessionState::Failed);
    ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::ConnectionError);
    ASSERT(h.bridge->capture_releases == 1);
}

static void test_local_close_is_not_a_connection_loss() {
    const std::string log_path = "/tmp/lumiere_test_session_log.txt";
    std::remove(log_path.c_str());
    Logger::shutdown();
    Logger::initialize(LogLevel::WARN, log_path);

    {
        Harness h;
        h.transport->block_receive = true;
        ASSERT(h.session->open(test_config()));
        ASSERT(h.session->wait_until_open(2000));
        // The receiver is parked inside receive() when the channel is closed
        ASSERT(wait_for([&]() {
            std::lock_guard<std::mutex> lock(h.transport->mutex);
            return h.transport->receive_calls >= 1;
        }));
        h.session->close();
        ASSERT(h.session->state() == SessionState::Closed);
        ASSERT(h.host->closed.size() == 1 && h.host->closed[0] == CloseReason::Requested);
    }

    Logger::shutdown();
    std::ifstream log(log_path);
    std::stringstream contents;
    contents << log.rdbuf();
    ASSERT(contents.str().find("connection lost") == std::string::npos);
    ASSERT(contents.str().find("[ERROR]") == std::string::npos);
    std::remove(log_path.c_str());
}

static void test_reopen() {
    Harness h;
    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));
    h.session->close();

    ASSERT(h.session->open(test_config()));
    ASSERT(h.session->wait_until_open(2000));
    ASSERT(h.transport->created == 2);
    emit_frame(*h.bridge, make_frame(0.2f));
    ASSERT(wait_for([&]() { return h.sent_count() == 1; }));
    h.session->close();
    ASSERT(h.closed_count() == 2);
    ASSERT(h.bridge->capture_releases == 2);
}

int main() {
    test_end_to_end();
    test_close_idempotent();
    test_destructor_closes();
    test_mute();
    test_frames_while_connecting_discarded();
    test_backpressure_drops_oldest();
    test_transcripts();
    test_audio_scheduling();
    test_tool_dispatch();
    test_close_from_callback();
    test_handshake_failure();
    test_device_unavailable();
    test_close_while_connecting();
    test_remote_close();
    test_transport_failure();
    test_local_close_is_not_a_connection_loss();
    test_reopen();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All live session tests passed.\n";
    return 0;
}

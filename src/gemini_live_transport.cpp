#include "gemini_live_transport.h"
#include "core/constants.h"
#include "live_protocol.h"
#include "logger.h"
#include <curl/curl.h>
#include <poll.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace lumiere {

namespace {

/// Wait until the socket is readable (or writable) or the timeout expires
bool wait_socket(curl_socket_t fd, bool for_write, int timeout_ms) {
    if (fd == CURL_SOCKET_BAD) return false;
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = for_write ? POLLOUT : POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
    return rc > 0;
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

class GeminiLiveTransport::Impl {
public:
    explicit Impl(const LiveEndpointConfig& config)
        : config_(config), curl_(nullptr), socket_(CURL_SOCKET_BAD),
          assembler_(config.max_message_bytes), closed_(false), remote_closed_(false) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (curl_) {
                curl_easy_cleanup(curl_);
                curl_ = nullptr;
            }
        }
        curl_global_cleanup();
    }

    VoidResult connect(const SessionConfig& session) {
        if (config_.api_key.empty()) {
            return make_connection_error("API key missing");
        }

        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (curl_) {
                return make_error(ErrorType::InvalidState, "transport already connected");
            }
            curl_ = curl_easy_init();
            if (!curl_) {
                return make_connection_error("Failed to initialize CURL");
            }

            std::string url = config_.endpoint + "?key=" + config_.api_key;
            curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);  // WebSocket upgrade, then hand over
            curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
            // Bounds the upgrade exchange too, not just the TCP/TLS connect
            curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.connect_timeout_ms));
            curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

            LOG_TRANSPORT("connecting to " + config_.endpoint);
            CURLcode res = curl_easy_perform(curl_);
            if (res != CURLE_OK) {
                std::string msg = curl_easy_strerror(res);
                curl_easy_cleanup(curl_);
                curl_ = nullptr;
                return make_connection_error("WebSocket upgrade failed: " + msg);
            }
            curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, 0L);

            curl_socket_t fd = CURL_SOCKET_BAD;
            res = curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &fd);
            if (res != CURLE_OK || fd == CURL_SOCKET_BAD) {
                curl_easy_cleanup(curl_);
                curl_ = nullptr;
                return make_connection_error("no active socket after upgrade");
            }
            socket_ = fd;
        }

        auto sent = send_text(protocol::build_setup_message(session), config_.connect_timeout_ms);
        if (sent.is_error()) {
            return make_connection_error("setup send failed: " + sent.error().message);
        }

        // The session is usable only after setupComplete
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.connect_timeout_ms);
        while (true) {
            int left = remaining_ms(deadline);
            if (left <= 0) {
                return make_connection_error("timed out waiting for setupComplete");
            }
            auto message = read_message(left);
            if (message.is_error()) {
                if (message.error().type == ErrorType::Timeout) continue;
                return make_connection_error("handshake failed: " + message.error().message);
            }
            auto event = protocol::parse_server_message(message.value());
            if (event.is_error()) {
                Logger::warn("Ignoring malformed handshake message: " + event.error().message);
                continue;
            }
            if (event.value().session_error) {
                return make_connection_error("service rejected setup: " + *event.value().session_error);
            }
            if (event.value().setup_complete) {
                break;
            }
        }

        LOG_TRANSPORT("live session established (" + protocol::model_resource(session.model) + ")");
        return VoidResult();
    }

    VoidResult send_audio(const std::string& payload, int sample_rate) {
        return send_text(protocol::build_audio_message(payload, sample_rate),
                         constants::session::CLOSE_TIMEOUT_MS);
    }

    VoidResult send_tool_response(const ToolResponse& response) {
        return send_text(protocol::build_tool_response_message(response),
                         constants::session::CLOSE_TIMEOUT_MS);
    }

    Result<ServerEvent> receive(int timeout_ms) {
        auto message = read_message(timeout_ms);
        if (message.is_error()) {
            return message.error();
        }
        return protocol::parse_server_message(message.value());
    }

    VoidResult close(int timeout_ms) {
        bool already = closed_.exchange(true);
        if (already) {
            return VoidResult();
        }

        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (!curl_) {
                return VoidResult();  // never connected
            }
        }

        if (!remote_closed_) {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (curl_) {
                size_t sent = 0;
                // 1000 = normal closure, big-endian in the close payload
                const char code[2] = {static_cast<char>(0x03), static_cast<char>(0xE8)};
                CURLcode res = curl_ws_send(curl_, code, sizeof(code), &sent, 0, CURLWS_CLOSE);
                if (res != CURLE_OK) {
                    Logger::warn(std::string("WebSocket close frame not sent: ") + curl_easy_strerror(res));
                    return VoidResult();
                }
            }
        }

        // Bounded wait for the remote's close frame; data frames are discarded
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (!remote_closed_ && remaining_ms(deadline) > 0) {
            auto message = read_frames(remaining_ms(deadline), true);
            if (message.is_error() && message.error().type != ErrorType::Timeout) {
                break;
            }
        }
        if (!remote_closed_) {
            return make_error(ErrorType::Timeout, "remote did not acknowledge close");
        }
        LOG_TRANSPORT("channel closed");
        return VoidResult();
    }

    bool is_remote_closed() const {
        return remote_closed_;
    }

private:
    VoidResult send_text(const std::string& text, int timeout_ms) {
        if (remote_closed_) {
            return make_connection_error("channel closed by remote");
        }
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (true) {
            curl_socket_t fd;
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                if (!curl_) {
                    return make_connection_error("not connected");
                }
                size_t sent = 0;
                CURLcode res = curl_ws_send(curl_, text.data(), text.size(), &sent, 0, CURLWS_TEXT);
                if (res == CURLE_OK) {
                    return VoidResult();
                }
                if (res != CURLE_AGAIN) {
                    remote_closed_ = true;
                    return make_connection_error(std::string("send failed: ") + curl_easy_strerror(res));
                }
                fd = socket_;
            }
            int left = remaining_ms(deadline);
            if (left <= 0) {
                return make_error(ErrorType::Timeout, "send timed out");
            }
            wait_socket(fd, true, left);
        }
    }

    Result<std::string> read_message(int timeout_ms) {
        if (closed_) {
            return make_connection_error("channel closed locally");
        }
        return read_frames(timeout_ms, false);
    }

    /**
     * Reassemble frames into one complete message. A close frame sets
     * remote_closed_ and comes back as a synthesized sessionClosed message.
     */
    Result<std::string> read_frames(int timeout_ms, bool closing) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        char chunk[16384];

        while (true) {
            curl_socket_t fd;
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                if (!curl_) {
                    return make_connection_error("not connected");
                }
                if (remote_closed_) {
                    return make_connection_error("channel closed by remote");
                }

                size_t received = 0;
                const struct curl_ws_frame* meta = nullptr;
                CURLcode res = curl_ws_recv(curl_, chunk, sizeof(chunk), &received, &meta);

                if (res == CURLE_OK && meta) {
                    if (meta->flags & CURLWS_CLOSE) {
                        remote_closed_ = true;
                        handle_close_payload(chunk, received);
                        if (closing) {
                            return make_connection_error("closed");
                        }
                        return protocol::build_session_closed_message(close_code_, close_reason_);
                    }
                    if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
                        continue;  // libcurl answers pings itself
                    }

                    bool final_chunk = meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT);
                    auto status = assembler_.feed(chunk, received, final_chunk);
                    if (status == protocol::MessageAssembler::Status::TooLarge) {
                        if (closing) continue;
                        return make_codec_error("inbound message larger than " +
                                                std::to_string(config_.max_message_bytes) + " bytes");
                    }
                    if (status == protocol::MessageAssembler::Status::Complete) {
                        std::string message = assembler_.take();
                        if (closing) continue;
                        return message;
                    }
                    continue;
                }

                if (res != CURLE_AGAIN) {
                    remote_closed_ = true;
                    close_reason_ = curl_easy_strerror(res);
                    return make_connection_error(std::string("receive failed: ") + close_reason_);
                }
                fd = socket_;
            }

            int left = remaining_ms(deadline);
            if (left <= 0) {
                return make_timeout_error("no message");
            }
            wait_socket(fd, false, left);
        }
    }

    void handle_close_payload(const char* data, size_t len) {
        close_code_ = 0;
        close_reason_.clear();
        if (len >= 2) {
            close_code_ = (static_cast<unsigned char>(data[0]) << 8) | static_cast<unsigned char>(data[1]);
            close_reason_.assign(data + 2, len - 2);
        }
        LOG_TRANSPORT("remote closed channel (code " + std::to_string(close_code_) +
                      (close_reason_.empty() ? "" : ", " + close_reason_) + ")");
    }

    LiveEndpointConfig config_;
    std::mutex curl_mutex_;
    CURL* curl_;
    curl_socket_t socket_;
    protocol::MessageAssembler assembler_;
    int close_code_ = 0;
    std::string close_reason_;

    std::atomic<bool> closed_;
    std::atomic<bool> remote_closed_;
};

GeminiLiveTransport::GeminiLiveTransport(const LiveEndpointConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

GeminiLiveTransport::~GeminiLiveTransport() = default;

VoidResult GeminiLiveTransport::connect(const SessionConfig& config) {
    return pimpl_->connect(config);
}

VoidResult GeminiLiveTransport::send_audio(const std::string& payload, int sample_rate) {
    return pimpl_->send_audio(payload, sample_rate);
}

VoidResult GeminiLiveTransport::send_tool_response(const ToolResponse& response) {
    return pimpl_->send_tool_response(response);
}

Result<ServerEvent> GeminiLiveTransport::receive(int timeout_ms) {
    return pimpl_->receive(timeout_ms);
}

VoidResult GeminiLiveTransport::close(int timeout_ms) {
    return pimpl_->close(timeout_ms);
}

bool GeminiLiveTransport::is_remote_closed() const {
    return pimpl_->is_remote_closed();
}

} // namespace lumiere

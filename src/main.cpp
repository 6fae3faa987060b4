#include "audio_io.h"
#include "core/config.h"
#include "gemini_live_transport.h"
#include "live_session.h"
#include "logger.h"
#include "persona.h"
#include "tool_dispatcher.h"
#include "utils.h"
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>

namespace lumiere {

static volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int) {
    g_stop_requested = 1;
}

namespace {

std::mutex g_console_mutex;

std::string default_config_path() {
    std::string config_path = "config/config.json";
    // Try config directory relative to executable (e.g. build/../config)
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) {
                config_path = candidate;
            }
        }
    }
    return config_path;
}

void print_products(const std::vector<Product>& products) {
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << "\n--- " << products.size() << " recommendation(s) ---\n";
    for (const auto& p : products) {
        std::cout << "  [" << p.id << "] " << p.brand << " - " << p.name << "  " << p.price;
        if (p.currency) std::cout << " " << *p.currency;
        if (p.category) std::cout << "  (" << *p.category << ")";
        std::cout << "\n      " << p.description << "\n";
    }
    std::cout << std::flush;
}

void print_transcript(const char* who, const std::string& text, bool is_final) {
    // Partials are only logged; the console shows finished utterances
    if (!is_final) {
        Logger::debug(std::string(who) + " (partial): " + text);
        return;
    }
    std::lock_guard<std::mutex> lock(g_console_mutex);
    std::cout << who << ": " << text << std::endl;
}

} // namespace

} // namespace lumiere

int main(int argc, char* argv[]) {
    // Initialize logger (default to INFO level, console output)
    lumiere::Logger::initialize(lumiere::LogLevel::INFO);

    // List devices if requested (check before loading config)
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        lumiere::AudioIO::list_devices();
        lumiere::Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : lumiere::default_config_path();
    lumiere::Config config;
    if (std::ifstream(config_path).good()) {
        auto loaded = lumiere::Config::load(config_path);
        if (loaded.is_error()) {
            lumiere::Logger::error(loaded.error().to_string());
            lumiere::Logger::shutdown();
            return 1;
        }
        config = loaded.value();
    } else {
        lumiere::Logger::warn("No config at " + config_path + ", using defaults");
        config = lumiere::Config::defaults();
    }

    lumiere::Logger::shutdown();
    lumiere::Logger::initialize(lumiere::Logger::parse_level(config.logging.level), config.logging.file);

    if (config.live.api_key.empty()) {
        lumiere::Logger::error("No API key: set GEMINI_API_KEY (or live.api_key in " + config_path + ")");
        lumiere::Logger::shutdown();
        return 1;
    }

    lumiere::ToolDispatcher dispatcher;
    lumiere::SessionConfig session_config = lumiere::make_session_config(config, dispatcher.manifest_json());

    lumiere::LiveEndpointConfig endpoint;
    endpoint.endpoint = config.live.endpoint;
    endpoint.api_key = config.live.api_key;
    endpoint.connect_timeout_ms = config.live.connect_timeout_ms;

    lumiere::SessionOptions options;
    options.close_timeout_ms = config.session.close_timeout_ms;
    options.outbound_queue_depth = config.session.outbound_queue_depth;
    options.receive_poll_ms = config.session.receive_poll_ms;

    std::atomic<bool> session_ended{false};
    std::atomic<bool> session_failed{false};

    lumiere::SessionCallbacks callbacks;
    callbacks.on_products_found = [](const std::vector<lumiere::Product>& products) {
        lumiere::print_products(products);
    };
    callbacks.on_user_transcript = [](const std::string& text, bool is_final) {
        lumiere::print_transcript("You", text, is_final);
    };
    callbacks.on_agent_transcript = [&config](const std::string& text, bool is_final) {
        lumiere::print_transcript(config.persona.stylist_name.c_str(), text, is_final);
    };
    callbacks.on_closed = [&](lumiere::CloseReason reason, const std::string& message) {
        bool failed = reason == lumiere::CloseReason::DeviceUnavailable ||
                      reason == lumiere::CloseReason::ConnectionError;
        session_failed = failed;
        session_ended = true;
        std::lock_guard<std::mutex> lock(lumiere::g_console_mutex);
        std::cout << "\nSession ended (" << lumiere::close_reason_name(reason)
                  << (message.empty() ? "" : ": " + message) << ")" << std::endl;
    };

    auto bridge = std::make_unique<lumiere::AudioIO>(config.audio.input_device, config.audio.output_device);
    lumiere::LiveSession session(
        std::move(bridge),
        [endpoint]() { return std::make_unique<lumiere::GeminiLiveTransport>(endpoint); },
        callbacks,
        options);

    // Set up signal handlers
    std::signal(SIGINT, lumiere::signal_handler);
    std::signal(SIGTERM, lumiere::signal_handler);

    if (!session.open(session_config)) {
        lumiere::Logger::error("Could not start the live session");
        lumiere::Logger::shutdown();
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(lumiere::g_console_mutex);
        std::cout << "Connecting to " << config.persona.stylist_name << " in "
                  << config.persona.city << "... (m = mute/unmute, q = quit)" << std::endl;
    }

    // Console loop: poll stdin so signals and remote closes are noticed promptly
    bool stdin_open = true;
    while (!lumiere::g_stop_requested && !session_ended) {
        struct pollfd pfd;
        pfd.fd = stdin_open ? STDIN_FILENO : -1;  // negative fd: poll just sleeps
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, 200);
        if (ready <= 0 || !(pfd.revents & (POLLIN | POLLHUP))) {
            continue;
        }

        std::string line;
        if (!std::getline(std::cin, line)) {
            stdin_open = false;  // keep the session until a signal or remote close
            continue;
        }
        line = lumiere::utils::trim_copy(line);
        if (line == "q" || line == "quit") {
            break;
        }
        if (line == "m" || line == "mute") {
            bool muted = !session.is_muted();
            session.set_muted(muted);
            std::lock_guard<std::mutex> lock(lumiere::g_console_mutex);
            std::cout << (muted ? "Microphone muted" : "Microphone live") << std::endl;
        }
    }

    if (lumiere::g_stop_requested) {
        lumiere::Logger::info("Shutting down...");
    }
    session.close();

    int result = session_failed ? 1 : 0;

    // Shutdown logger
    lumiere::Logger::shutdown();

    return result;
}

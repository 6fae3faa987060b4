/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace lumiere {
namespace config {

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

AudioConfig parse_audio_config(const json& j) {
    AudioConfig config;
    if (!j.contains("audio")) return config;

    const auto& audio = j["audio"];
    config.input_device = get_or_default(audio, "input_device", config.input_device);
    config.output_device = get_or_default(audio, "output_device", config.output_device);
    return config;
}

LiveConfig parse_live_config(const json& j) {
    LiveConfig config;
    if (!j.contains("live")) return config;

    const auto& live = j["live"];
    config.endpoint = get_or_default(live, "endpoint", config.endpoint);
    config.model = get_or_default(live, "model", config.model);
    config.voice = get_or_default(live, "voice", config.voice);
    config.api_key = get_or_default(live, "api_key", config.api_key);
    config.connect_timeout_ms = get_or_default(live, "connect_timeout_ms", config.connect_timeout_ms);
    for (const char* fixed : {"input_sample_rate", "output_sample_rate", "frame_size"}) {
        if (live.contains(fixed)) {
            Logger::warn(std::string("live.") + fixed + " is fixed by the service audio contract; ignoring");
        }
    }
    return config;
}

PersonaConfig parse_persona_config(const json& j) {
    PersonaConfig config;
    if (!j.contains("persona")) return config;

    const auto& persona = j["persona"];
    config.stylist_name = get_or_default(persona, "stylist_name", config.stylist_name);
    config.city = get_or_default(persona, "city", config.city);
    config.country = get_or_default(persona, "country", config.country);
    config.instruction_template = get_or_default(persona, "instruction_template", config.instruction_template);
    return config;
}

SessionTuning parse_session_config(const json& j) {
    SessionTuning config;
    if (!j.contains("session")) return config;

    const auto& session = j["session"];
    config.close_timeout_ms = get_or_default(session, "close_timeout_ms", config.close_timeout_ms);
    config.outbound_queue_depth = get_or_default(session, "outbound_queue_depth", config.outbound_queue_depth);
    config.receive_poll_ms = get_or_default(session, "receive_poll_ms", config.receive_poll_ms);
    return config;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    if (!j.contains("logging")) return config;

    const auto& logging = j["logging"];
    config.level = get_or_default(logging, "level", config.level);
    config.file = get_or_default(logging, "file", config.file);
    return config;
}

} // anonymous namespace

// =============================================================================
// AppConfig Implementation
// =============================================================================

Result<AppConfig> AppConfig::load(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return make_error(ErrorType::ConfigError, "Failed to open config file: " + path);
        }

        json j = json::parse(file);
        AppConfig config;

        config.audio = parse_audio_config(j);
        config.live = parse_live_config(j);
        config.persona = parse_persona_config(j);
        config.session = parse_session_config(j);
        config.logging = parse_logging_config(j);

        config.apply_env_overrides();

        // Validate
        std::string validation_error = config.validate();
        if (!validation_error.empty()) {
            return make_error(ErrorType::ConfigError, "Config validation failed: " + validation_error);
        }

        Logger::info("Configuration loaded from: " + path);
        return config;

    } catch (const json::exception& e) {
        return make_error(ErrorType::ConfigError, std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return make_error(ErrorType::ConfigError, std::string("Error loading config: ") + e.what());
    }
}

AppConfig AppConfig::defaults() {
    AppConfig config;  // All defaults are set in struct definitions
    config.apply_env_overrides();
    return config;
}

void AppConfig::apply_env_overrides() {
    std::string key = env_or_empty("GEMINI_API_KEY");
    if (key.empty()) {
        key = env_or_empty("API_KEY");
    }
    if (!key.empty()) {
        live.api_key = key;
    }

    std::string level = env_or_empty("LUMIERE_LOG_LEVEL");
    if (!level.empty()) {
        logging.level = level;
    }
}

std::string AppConfig::validate() const {
    std::ostringstream errors;

    // Validate live service
    if (live.endpoint.rfind("wss://", 0) != 0 && live.endpoint.rfind("ws://", 0) != 0) {
        errors << "live.endpoint must be a ws:// or wss:// URL; ";
    }
    if (live.model.empty()) {
        errors << "live.model is required; ";
    }
    if (live.connect_timeout_ms <= 0) {
        errors << "live.connect_timeout_ms must be positive; ";
    }

    // Validate session tuning
    if (session.close_timeout_ms <= 0) {
        errors << "session.close_timeout_ms must be positive; ";
    }
    if (session.outbound_queue_depth == 0) {
        errors << "session.outbound_queue_depth must be at least 1; ";
    }
    if (session.receive_poll_ms <= 0) {
        errors << "session.receive_poll_ms must be positive; ";
    }

    // Validate persona
    if (persona.instruction_template.empty()) {
        errors << "persona.instruction_template is required; ";
    }

    return errors.str();
}

} // namespace config
} // namespace lumiere

#pragma once

/**
 * @file config.h
 * @brief Unified configuration system
 *
 * This file defines the configuration structure for the live client.
 * It supports:
 * - JSON file loading
 * - Environment variable overrides
 * - Default values
 * - Validation
 */

#include "types.h"
#include "constants.h"
#include "errors.h"
#include <string>

namespace lumiere {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

/**
 * @brief Audio device selection
 */
struct AudioConfig {
    std::string input_device = "default";   ///< "default", a device index or an exact name
    std::string output_device = "default";
};

/**
 * @brief Live service connection
 *
 * Sample rates and frame size are not configurable; they are fixed by the
 * service audio contract in constants::audio.
 */
struct LiveConfig {
    std::string endpoint = constants::protocol::DEFAULT_ENDPOINT;
    std::string model = constants::protocol::DEFAULT_MODEL;
    std::string voice = constants::protocol::DEFAULT_VOICE;
    std::string api_key;  ///< Usually supplied through GEMINI_API_KEY
    int connect_timeout_ms = constants::session::CONNECT_TIMEOUT_MS;
};

/**
 * @brief Stylist persona and the user's location
 *
 * The template may use {name}, {city} and {country}.
 */
struct PersonaConfig {
    std::string stylist_name = "Lumiere";
    std::string city = "Paris";
    std::string country = "France";
    std::string instruction_template =
        "You are {name}, a high-end virtual stylist. The user is in {city}, {country}. "
        "Talk about fashion, local trends and weather, and keep answers concise and chic. "
        "When you recommend specific items, always use the tool 'displayProducts' to show them "
        "to the user, with an estimated price for each.";
};

/**
 * @brief Session lifecycle tuning
 */
struct SessionTuning {
    int close_timeout_ms = constants::session::CLOSE_TIMEOUT_MS;
    size_t outbound_queue_depth = constants::session::OUTBOUND_QUEUE_DEPTH;
    int receive_poll_ms = constants::session::RECEIVE_POLL_MS;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file;  // Empty = stdout only
};

// =============================================================================
// Main Configuration
// =============================================================================

/**
 * @brief Complete client configuration
 */
struct AppConfig {
    AudioConfig audio;
    LiveConfig live;
    PersonaConfig persona;
    SessionTuning session;
    LoggingConfig logging;

    /**
     * @brief Load configuration from JSON file
     * @param path Path to JSON config file
     * @return Loaded config (environment overrides applied) or ConfigError
     */
    static Result<AppConfig> load(const std::string& path);

    /**
     * @brief Create with default values
     */
    static AppConfig defaults();

    /**
     * @brief Apply GEMINI_API_KEY / API_KEY and LUMIERE_LOG_LEVEL
     */
    void apply_env_overrides();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;
};

} // namespace config

// Convenience alias
using Config = config::AppConfig;

} // namespace lumiere
